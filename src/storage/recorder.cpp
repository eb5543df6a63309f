// src/storage/recorder.cpp

#include "signal_ngin/storage/recorder.hpp"
#include <filesystem>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/storage/journal.hpp"

namespace signal_ngin {

Recorder::Recorder(RecordSchema schema, std::unique_ptr<RecordSink> csv,
                   std::unique_ptr<RecordSink> journal)
    : schema_(std::move(schema)), csv_(std::move(csv)), journal_(std::move(journal)) {
    if (!csv_ || !journal_) {
        throw std::invalid_argument("Recorder requires a CSV sink and a journal sink");
    }
}

Result<std::unique_ptr<Recorder>> Recorder::open(const RecorderConfig& config,
                                                 RecordSchema schema, Timestamp run_start) {
    namespace fs = std::filesystem;
    fs::path dir(config.output_directory);
    const std::string base =
        config.file_prefix + "_" + core::format_time(run_start, "%Y%m%d_%H%M%S");

    std::string stem = base;
    for (int n = 1; fs::exists(dir / (stem + ".csv")) || fs::exists(dir / (stem + ".jsonl"));
         ++n) {
        if (n > MAX_STEM_SUFFIX) {
            return make_error<std::unique_ptr<Recorder>>(
                ErrorCode::FILE_IO_ERROR, "No free record file name for " + base, "Recorder");
        }
        stem = base + "_" + std::to_string(n);
    }
    if (stem != base) {
        WARN("Record files for " << base << " already exist, using " << stem);
    }

    auto csv = FileRecordSink::create((dir / (stem + ".csv")).string());
    if (csv.is_error()) {
        return forward_error<std::unique_ptr<Recorder>>(csv, "Recorder");
    }
    auto journal = FileRecordSink::create((dir / (stem + ".jsonl")).string());
    if (journal.is_error()) {
        return forward_error<std::unique_ptr<Recorder>>(journal, "Recorder");
    }

    auto recorder = std::make_unique<Recorder>(std::move(schema), csv.take(), journal.take());
    INFO("Recording to " << recorder->csv_target() << " with journal " << stem << ".jsonl");
    return Result<std::unique_ptr<Recorder>>(std::move(recorder));
}

Result<void> Recorder::drain(RecordSink& sink, std::deque<std::string>& backlog) {
    while (!backlog.empty()) {
        auto written = sink.write_line(backlog.front());
        if (written.is_error()) {
            return written;
        }
        backlog.pop_front();
    }
    return Result<void>();
}

Result<void> Recorder::emit(RecordSink& sink, std::deque<std::string>& backlog,
                            std::string line) {
    backlog.push_back(std::move(line));
    auto drained = drain(sink, backlog);
    if (drained.is_error()) {
        ERROR("Record write failed on " << sink.describe() << ", " << backlog.size()
                                        << " line(s) backlogged: " << drained.error()->what());
    }
    return drained;
}

Result<void> Recorder::journal(const nlohmann::json& event) {
    return emit(*journal_, journal_backlog_, event.dump());
}

Result<void> Recorder::start_session(const std::string& run_id, Timestamp wall_time,
                                     const nlohmann::json& config) {
    auto header = emit(*csv_, csv_backlog_, schema_.header_line());
    auto started =
        journal(JournalFormat::session_start(run_id, wall_time, schema_.columns(), config));
    if (header.is_error()) {
        return header;
    }
    return started;
}

Result<void> Recorder::record_prediction(const PredictionRow& row) {
    if (last_tick_time_ && row.tick_time <= *last_tick_time_) {
        return make_error<void>(ErrorCode::DUPLICATE_RECORD,
                                "Tick " + std::to_string(core::to_epoch_ms(row.tick_time)) +
                                    " is not after the previous prediction",
                                "Recorder");
    }
    last_tick_time_ = row.tick_time;
    return journal(JournalFormat::prediction(row));
}

Result<void> Recorder::record_resolutions(const std::vector<ResolutionEvent>& events,
                                          Timestamp wall_time) {
    for (const auto& event : events) {
        auto written = journal(JournalFormat::resolution(event, wall_time));
        if (written.is_error()) {
            return written;
        }
    }
    return Result<void>();
}

Result<void> Recorder::write_rows(const std::vector<PredictionRow>& rows) {
    Result<void> status;
    for (const auto& row : rows) {
        auto written = emit(*csv_, csv_backlog_, schema_.format_row(row));
        ++rows_written_;
        if (written.is_error() && status.is_ok()) {
            status = std::move(written);
        }
    }
    return status;
}

Result<void> Recorder::end_session(Timestamp wall_time, size_t rows_left_pending) {
    auto ended = journal(JournalFormat::session_end(wall_time, rows_written_, rows_left_pending));
    auto csv_flush = csv_->flush();
    if (ended.is_error()) {
        return ended;
    }
    if (csv_flush.is_error()) {
        return csv_flush;
    }
    return journal_->flush();
}

Result<void> Recorder::retry_backlog() {
    auto csv_drained = drain(*csv_, csv_backlog_);
    if (csv_drained.is_error()) {
        return csv_drained;
    }
    return drain(*journal_, journal_backlog_);
}

}  // namespace signal_ngin
