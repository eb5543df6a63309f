// include/signal_ngin/live/tick_scheduler.hpp
// Drives the prediction pipeline on a fixed wall-clock grid

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/data/market_snapshot_source.hpp"
#include "signal_ngin/ensemble/ensemble_combiner.hpp"
#include "signal_ngin/features/feature_engine.hpp"
#include "signal_ngin/models/model_runner.hpp"
#include "signal_ngin/resolution/outcome_resolver.hpp"
#include "signal_ngin/storage/recorder.hpp"

namespace signal_ngin {

/**
 * @brief Scheduler settings
 */
struct SchedulerConfig : public ConfigBase {
    int cadence_ms{30000};
    int fetch_timeout_ms{5000};
    int model_timeout_ms{2000};  // Shared deadline for the model fan-out
    int write_retry_backoff_ms{500};
    int write_retry_max_attempts{8};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["cadence_ms"] = cadence_ms;
        j["fetch_timeout_ms"] = fetch_timeout_ms;
        j["model_timeout_ms"] = model_timeout_ms;
        j["write_retry_backoff_ms"] = write_retry_backoff_ms;
        j["write_retry_max_attempts"] = write_retry_max_attempts;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("cadence_ms"))
            cadence_ms = j.at("cadence_ms").get<int>();
        if (j.contains("fetch_timeout_ms"))
            fetch_timeout_ms = j.at("fetch_timeout_ms").get<int>();
        if (j.contains("model_timeout_ms"))
            model_timeout_ms = j.at("model_timeout_ms").get<int>();
        if (j.contains("write_retry_backoff_ms"))
            write_retry_backoff_ms = j.at("write_retry_backoff_ms").get<int>();
        if (j.contains("write_retry_max_attempts"))
            write_retry_max_attempts = j.at("write_retry_max_attempts").get<int>();
    }
};

enum class SchedulerState { IDLE, TICKING, HALTED, STOPPED };

enum class TickOutcome {
    RECORDED,           // Prediction journaled and added to the pending set
    SKIPPED_NO_DATA,    // No usable snapshot; nothing written
    SKIPPED_HISTORY,    // History window not yet filled; resolution still ran
    SKIPPED_DUPLICATE,  // Tick time not after the previous prediction
    HALTED              // Store failure; predictions stop until the backlog drains
};

inline std::string scheduler_state_to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::IDLE:
            return "IDLE";
        case SchedulerState::TICKING:
            return "TICKING";
        case SchedulerState::HALTED:
            return "HALTED";
        case SchedulerState::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
    }
}

inline std::string tick_outcome_to_string(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::RECORDED:
            return "RECORDED";
        case TickOutcome::SKIPPED_NO_DATA:
            return "SKIPPED_NO_DATA";
        case TickOutcome::SKIPPED_HISTORY:
            return "SKIPPED_HISTORY";
        case TickOutcome::SKIPPED_DUPLICATE:
            return "SKIPPED_DUPLICATE";
        case TickOutcome::HALTED:
            return "HALTED";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Summary of one tick
 */
struct TickReport {
    Timestamp tick_time;
    TickOutcome outcome{TickOutcome::SKIPPED_NO_DATA};
    size_t resolved{0};
    size_t expired{0};
    size_t finalized{0};  // Rows written to the CSV record
    std::vector<std::string> unavailable_models;
    EnsemblePrediction ensemble;  // Empty unless a prediction was made
    std::chrono::milliseconds elapsed{0};
    std::string detail;
};

/**
 * @brief Everything the scheduler drives
 */
struct Pipeline {
    std::shared_ptr<MarketSnapshotSource> source;
    std::unique_ptr<FeatureEngine> features;
    std::vector<std::unique_ptr<ModelRunner>> runners;
    std::unique_ptr<EnsembleCombiner> ensemble;
    std::unique_ptr<OutcomeResolver> resolver;
    std::unique_ptr<Recorder> recorder;
};

/**
 * @brief Tick loop state machine: IDLE -> TICKING -> IDLE, with HALTED on store failure
 * and STOPPED after shutdown
 *
 * Ticks land on the epoch-anchored cadence grid. A tick that runs past the next grid
 * instant causes the missed instants to be skipped and logged; ticks never run
 * back-to-back to catch up.
 */
class TickScheduler {
public:
    /**
     * @throws std::invalid_argument if a pipeline part is missing or the settings are invalid
     */
    TickScheduler(SchedulerConfig config, std::vector<HorizonKey> horizons,
                  std::shared_ptr<Clock> clock, Pipeline pipeline);
    ~TickScheduler();

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    /**
     * @brief Open the recording session
     */
    Result<void> start(const std::string& run_id, const nlohmann::json& run_config);

    /**
     * @brief Tick until a stop is requested, then shut down
     * @return FILE_IO_ERROR once write retries are exhausted
     */
    Result<void> run();

    /**
     * @brief Execute a single tick anchored at tick_time
     */
    TickReport run_tick(Timestamp tick_time);

    /**
     * @brief Write every still-pending row as pending, close the session and stop models
     */
    Result<void> shutdown();

    /**
     * @brief Async-signal-safe stop request
     */
    void request_stop() {
        stop_requested_.store(true, std::memory_order_release);
    }

    bool stop_requested() const {
        return stop_requested_.load(std::memory_order_acquire);
    }

    SchedulerState state() const {
        return state_.load();
    }

    size_t skipped_ticks() const {
        return skipped_ticks_;
    }

    size_t pending_rows() const {
        return pending_.size();
    }

    const HistoryWindow& history() const {
        return history_;
    }

    const Recorder& recorder() const {
        return *pipeline_.recorder;
    }

    /**
     * @brief Backoff before the given retry attempt (0-based), capped at 60 s
     */
    std::chrono::milliseconds retry_backoff(int attempt) const;

private:
    std::vector<ModelOutput> fan_out(const FeatureVectorPtr& features, TickReport& report);
    size_t resolve_pending(Timestamp current, TickReport& report, bool& store_failed);
    void enter_halt(const std::string& why);
    Result<void> wait_out_halt();
    void report_component(const std::string& id, ComponentState state,
                          const std::string& message = "");
    void log_tick(const TickReport& report) const;

    SchedulerConfig config_;
    std::vector<HorizonKey> horizons_;
    std::shared_ptr<Clock> clock_;
    Pipeline pipeline_;

    HistoryWindow history_;
    PriceTape tape_;
    PendingRowSet pending_;

    std::atomic<SchedulerState> state_{SchedulerState::IDLE};
    std::atomic<bool> stop_requested_{false};
    bool session_open_{false};
    bool store_lost_{false};
    uint64_t next_sequence_{1};
    size_t skipped_ticks_{0};
};

}  // namespace signal_ngin
