// include/signal_ngin/storage/recorder.hpp
#pragma once

#include <deque>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/resolution/outcome_resolver.hpp"
#include "signal_ngin/storage/record_schema.hpp"
#include "signal_ngin/storage/record_sink.hpp"

namespace signal_ngin {

/**
 * @brief Recorder settings
 */
struct RecorderConfig : public ConfigBase {
    std::string output_directory{"output"};
    std::string file_prefix{"signal_log"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["output_directory"] = output_directory;
        j["file_prefix"] = file_prefix;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("output_directory"))
            output_directory = j.at("output_directory").get<std::string>();
        if (j.contains("file_prefix"))
            file_prefix = j.at("file_prefix").get<std::string>();
        if (j.contains("journal_enabled") && !j.at("journal_enabled").get<bool>())
            throw std::invalid_argument(
                "The prediction journal cannot be disabled; it is the only tick-time record");
    }
};

/**
 * @brief Persists predictions and their outcomes
 *
 * The CSV sink receives one line per row once the row is final (or at shutdown); the
 * journal sink receives every event as it happens, so a prediction survives a crash before
 * its row is final. A line that fails to write
 * stays in an in-order backlog, and later lines queue behind it until retry_backlog()
 * gets through.
 */
class Recorder {
public:
    /**
     * @throws std::invalid_argument if either sink is missing
     */
    Recorder(RecordSchema schema, std::unique_ptr<RecordSink> csv,
             std::unique_ptr<RecordSink> journal);

    /**
     * @brief Create file sinks named <prefix>_<YYYYMMDD_HHMMSS>.csv / .jsonl
     *
     * When a file with that stem already exists (a restart within the same second), the
     * first free stem among <stem>_1, <stem>_2, ... is used instead.
     */
    static Result<std::unique_ptr<Recorder>> open(const RecorderConfig& config,
                                                  RecordSchema schema, Timestamp run_start);

    /**
     * @brief Write the CSV header and the session_start event
     */
    Result<void> start_session(const std::string& run_id, Timestamp wall_time,
                               const nlohmann::json& config);

    /**
     * @brief Journal a new prediction
     * @return DUPLICATE_RECORD if the tick time is not after the previous prediction's
     */
    Result<void> record_prediction(const PredictionRow& row);

    Result<void> record_resolutions(const std::vector<ResolutionEvent>& events,
                                    Timestamp wall_time);

    /**
     * @brief Append rows to the CSV record
     */
    Result<void> write_rows(const std::vector<PredictionRow>& rows);

    Result<void> end_session(Timestamp wall_time, size_t rows_left_pending);

    /**
     * @brief Re-attempt backlogged lines in order
     */
    Result<void> retry_backlog();

    bool has_backlog() const {
        return !csv_backlog_.empty() || !journal_backlog_.empty();
    }

    size_t backlog_size() const {
        return csv_backlog_.size() + journal_backlog_.size();
    }

    size_t rows_written() const {
        return rows_written_;
    }

    const RecordSchema& schema() const {
        return schema_;
    }

    std::string csv_target() const {
        return csv_->describe();
    }

private:
    static constexpr int MAX_STEM_SUFFIX = 999;

    Result<void> emit(RecordSink& sink, std::deque<std::string>& backlog, std::string line);
    static Result<void> drain(RecordSink& sink, std::deque<std::string>& backlog);
    Result<void> journal(const nlohmann::json& event);

    RecordSchema schema_;
    std::unique_ptr<RecordSink> csv_;
    std::unique_ptr<RecordSink> journal_;
    std::deque<std::string> csv_backlog_;
    std::deque<std::string> journal_backlog_;

    std::optional<Timestamp> last_tick_time_;
    size_t rows_written_{0};
};

}  // namespace signal_ngin
