#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "core/test_doubles.hpp"
#include "signal_ngin/storage/recorder.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class RecorderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        csv_state = std::make_shared<SinkState>();
        journal_state = std::make_shared<SinkState>();
        recorder = std::make_unique<Recorder>(
            RecordSchema({"hcqr"}, {10}, 10), std::make_unique<MemoryRecordSink>(csv_state, "csv"),
            std::make_unique<MemoryRecordSink>(journal_state, "journal"));
    }

    static PredictionRow row(uint64_t sequence, int64_t tick_ms) {
        PredictionRow r;
        r.sequence = sequence;
        r.tick_time = at_ms(tick_ms);
        r.snapshot_time = at_ms(tick_ms);
        r.wall_time = at_ms(tick_ms);
        r.entry_mid = 25.0;
        r.outcomes[10] = HorizonOutcome{};
        return r;
    }

    nlohmann::json journal_event(size_t i) const {
        return nlohmann::json::parse(journal_state->lines.at(i));
    }

    std::shared_ptr<SinkState> csv_state;
    std::shared_ptr<SinkState> journal_state;
    std::unique_ptr<Recorder> recorder;
};

TEST_F(RecorderTest, SessionStartWritesHeaderAndEvent) {
    ASSERT_TRUE(recorder->start_session("run_1", at_ms(0), {{"cadence_ms", 30000}}).is_ok());
    ASSERT_EQ(csv_state->lines.size(), 1u);
    EXPECT_EQ(csv_state->lines[0], recorder->schema().header_line());

    auto event = journal_event(0);
    EXPECT_EQ(event["event"], "session_start");
    EXPECT_EQ(event["run_id"], "run_1");
    EXPECT_EQ(event["config"]["cadence_ms"], 30000);
    EXPECT_EQ(event["columns"].size(), recorder->schema().columns().size());
}

TEST_F(RecorderTest, RejectsRepeatedTick) {
    ASSERT_TRUE(recorder->record_prediction(row(1, 30000)).is_ok());
    auto repeated = recorder->record_prediction(row(2, 30000));
    ASSERT_TRUE(repeated.is_error());
    EXPECT_EQ(repeated.error()->code(), ErrorCode::DUPLICATE_RECORD);
    EXPECT_TRUE(recorder->record_prediction(row(2, 60000)).is_ok());

    ASSERT_EQ(journal_state->lines.size(), 2u);
    EXPECT_EQ(journal_event(0)["event"], "prediction");
    EXPECT_EQ(journal_event(1)["sequence"], 2);
}

TEST_F(RecorderTest, ResolutionAndExpiryEvents) {
    ResolutionEvent resolved;
    resolved.sequence = 4;
    resolved.tick_time = at_ms(30000);
    resolved.horizon = 10;
    resolved.outcome.status = OutcomeStatus::RESOLVED;
    resolved.outcome.realized_return = -0.002;
    resolved.outcome.exit_time = at_ms(40000);
    resolved.outcome.exit_mid = 24.95;

    ResolutionEvent expired = resolved;
    expired.outcome = HorizonOutcome{};
    expired.outcome.status = OutcomeStatus::EXPIRED;
    expired.gap = EngineError(ErrorCode::RESOLUTION_GAP, "no snapshot by the deadline",
                              "OutcomeResolver")
                      .to_string();

    ASSERT_TRUE(recorder->record_resolutions({resolved, expired}, at_ms(41000)).is_ok());
    ASSERT_EQ(journal_state->lines.size(), 2u);
    auto first = journal_event(0);
    EXPECT_EQ(first["event"], "resolution");
    EXPECT_EQ(first["realized_up"], false);
    EXPECT_EQ(first["exit_ts_ms"], 40000);
    auto second = journal_event(1);
    EXPECT_EQ(second["event"], "expiry");
    EXPECT_FALSE(second.contains("realized_ret"));
    EXPECT_NE(second["error"].get<std::string>().find("RESOLUTION_GAP"), std::string::npos);
    EXPECT_FALSE(first.contains("error"));
}

TEST_F(RecorderTest, FailedWritesAreBackloggedInOrder) {
    ASSERT_TRUE(recorder->start_session("run", at_ms(0), nlohmann::json::object()).is_ok());

    csv_state->fail_next = 1;
    auto first = recorder->write_rows({row(1, 30000)});
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error()->code(), ErrorCode::FILE_IO_ERROR);
    EXPECT_EQ(recorder->backlog_size(), 1u);
    EXPECT_TRUE(recorder->has_backlog());

    // The next row queues behind the failed one and both go out in order
    ASSERT_TRUE(recorder->write_rows({row(2, 60000)}).is_ok());
    EXPECT_FALSE(recorder->has_backlog());
    ASSERT_EQ(csv_state->lines.size(), 3u);
    EXPECT_EQ(split_csv(csv_state->lines[1])[1], "30000");
    EXPECT_EQ(split_csv(csv_state->lines[2])[1], "60000");
    EXPECT_EQ(recorder->rows_written(), 2u);
}

TEST_F(RecorderTest, RetryBacklogAfterOutage) {
    csv_state->failing = true;
    EXPECT_TRUE(recorder->write_rows({row(1, 30000), row(2, 60000)}).is_error());
    EXPECT_EQ(recorder->backlog_size(), 2u);
    EXPECT_TRUE(recorder->retry_backlog().is_error());
    EXPECT_EQ(recorder->backlog_size(), 2u);

    csv_state->failing = false;
    ASSERT_TRUE(recorder->retry_backlog().is_ok());
    EXPECT_EQ(recorder->backlog_size(), 0u);
    ASSERT_EQ(csv_state->lines.size(), 2u);
    EXPECT_EQ(split_csv(csv_state->lines[0])[1], "30000");
}

TEST_F(RecorderTest, EndSessionReportsCountsAndFlushes) {
    ASSERT_TRUE(recorder->write_rows({row(1, 30000)}).is_ok());
    ASSERT_TRUE(recorder->end_session(at_ms(90000), 3).is_ok());

    auto event = journal_event(journal_state->lines.size() - 1);
    EXPECT_EQ(event["event"], "session_end");
    EXPECT_EQ(event["rows_written"], 1);
    EXPECT_EQ(event["rows_left_pending"], 3);
    EXPECT_EQ(csv_state->flushes, 1u);
    EXPECT_EQ(journal_state->flushes, 1u);
}

TEST_F(RecorderTest, RequiresBothSinks) {
    auto state = std::make_shared<SinkState>();
    EXPECT_THROW(Recorder(RecordSchema({"hcqr"}, {10}, 10), std::make_unique<MemoryRecordSink>(state),
                          nullptr),
                 std::invalid_argument);
    EXPECT_THROW(Recorder(RecordSchema({"hcqr"}, {10}, 10), nullptr,
                          std::make_unique<MemoryRecordSink>(state)),
                 std::invalid_argument);
}

class RecorderFileTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        dir = std::filesystem::temp_directory_path() / "signal_ngin_recorder_test";
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
        TestBase::TearDown();
    }

    std::filesystem::path dir;
};

TEST_F(RecorderFileTest, OpensNewFilesAndNeverReusesThem) {
    RecorderConfig config;
    config.output_directory = dir.string();
    config.file_prefix = "hype";
    Timestamp start = at_ms(1741944413589);

    auto opened = Recorder::open(config, RecordSchema({"hcqr"}, {10}, 10), start);
    ASSERT_TRUE(opened.is_ok()) << opened.error()->to_string();
    auto recorder = opened.take();
    EXPECT_EQ(recorder->csv_target(), (dir / "hype_20250314_092653.csv").string());
    ASSERT_TRUE(recorder->start_session("run", start, nlohmann::json::object()).is_ok());
    ASSERT_TRUE(recorder->end_session(start, 0).is_ok());

    std::ifstream csv(dir / "hype_20250314_092653.csv");
    std::string header;
    ASSERT_TRUE(std::getline(csv, header));
    EXPECT_EQ(header, recorder->schema().header_line());
    EXPECT_TRUE(std::filesystem::exists(dir / "hype_20250314_092653.jsonl"));

    // A restart in the same second gets its own files
    auto again = Recorder::open(config, RecordSchema({"hcqr"}, {10}, 10), start);
    ASSERT_TRUE(again.is_ok()) << again.error()->to_string();
    EXPECT_EQ(again.value()->csv_target(), (dir / "hype_20250314_092653_1.csv").string());
    EXPECT_TRUE(std::filesystem::exists(dir / "hype_20250314_092653_1.jsonl"));

    auto third = Recorder::open(config, RecordSchema({"hcqr"}, {10}, 10), 
                                start + std::chrono::milliseconds(400));
    ASSERT_TRUE(third.is_ok());
    EXPECT_EQ(third.value()->csv_target(), (dir / "hype_20250314_092653_2.csv").string());

    // The original files are untouched
    std::ifstream reread(dir / "hype_20250314_092653.csv");
    std::string line;
    size_t count = 0;
    while (std::getline(reread, line)) ++count;
    EXPECT_EQ(count, 1u);
}

TEST_F(RecorderFileTest, StemTakenByJournalAloneIsSkipped) {
    std::filesystem::create_directories(dir);
    {
        std::ofstream stray(dir / "hype_20250314_092653.jsonl");
        stray << "{}\n";
    }
    RecorderConfig config;
    config.output_directory = dir.string();
    config.file_prefix = "hype";

    auto opened = Recorder::open(config, RecordSchema({"hcqr"}, {10}, 10), at_ms(1741944413589));
    ASSERT_TRUE(opened.is_ok()) << opened.error()->to_string();
    EXPECT_EQ(opened.value()->csv_target(), (dir / "hype_20250314_092653_1.csv").string());
    EXPECT_FALSE(std::filesystem::exists(dir / "hype_20250314_092653.csv"));
}

TEST_F(RecorderFileTest, PredictionSurvivesCrashWithoutShutdown) {
    RecorderConfig config;
    config.output_directory = dir.string();
    config.file_prefix = "hype";
    Timestamp start = at_ms(1741944413589);
    const int64_t tick_ms = 1741944420000;

    {
        auto opened = Recorder::open(config, RecordSchema({"hcqr"}, {10}, 10), start);
        ASSERT_TRUE(opened.is_ok()) << opened.error()->to_string();
        auto recorder = opened.take();
        ASSERT_TRUE(recorder->start_session("run", start, nlohmann::json::object()).is_ok());

        PredictionRow pending;
        pending.sequence = 1;
        pending.tick_time = at_ms(tick_ms);
        pending.snapshot_time = at_ms(tick_ms);
        pending.wall_time = at_ms(tick_ms);
        pending.entry_mid = 25.0;
        pending.outcomes[10] = HorizonOutcome{};
        ASSERT_TRUE(recorder->record_prediction(pending).is_ok());
        // Process dies here: no end_session, no CSV row for the pending prediction
    }

    std::ifstream journal(dir / "hype_20250314_092653.jsonl");
    std::string line;
    bool found = false;
    bool ended = false;
    while (std::getline(journal, line)) {
        auto event = nlohmann::json::parse(line);
        if (event["event"] == "prediction" && event["tick_ts_ms"] == tick_ms) found = true;
        if (event["event"] == "session_end") ended = true;
    }
    EXPECT_TRUE(found);
    EXPECT_FALSE(ended);
}

TEST_F(RecorderFileTest, SinkRefusesExistingFile) {
    std::filesystem::create_directories(dir);
    std::string path = (dir / "taken.csv").string();
    {
        std::ofstream existing(path);
        existing << "old\n";
    }
    auto sink = FileRecordSink::create(path);
    ASSERT_TRUE(sink.is_error());
    EXPECT_EQ(sink.error()->code(), ErrorCode::FILE_IO_ERROR);
}
