// src/live/tick_scheduler.cpp

#include "signal_ngin/live/tick_scheduler.hpp"
#include <algorithm>
#include <future>
#include <sstream>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

constexpr const char* SCHEDULER_ID = "scheduler";
constexpr const char* RECORDER_ID = "recorder";
constexpr std::chrono::milliseconds MAX_BACKOFF{60000};

const Pipeline& checked(const Pipeline& pipeline) {
    if (!pipeline.source || !pipeline.features || !pipeline.ensemble || !pipeline.resolver ||
        !pipeline.recorder) {
        throw std::invalid_argument("TickScheduler pipeline is incomplete");
    }
    if (pipeline.runners.empty()) {
        throw std::invalid_argument("TickScheduler needs at least one model");
    }
    return pipeline;
}

std::chrono::milliseconds tape_retention(const std::vector<HorizonKey>& horizons,
                                         const Pipeline& pipeline, int cadence_ms) {
    HorizonKey longest = horizons.empty() ? 0 : *std::max_element(horizons.begin(), horizons.end());
    return horizon_duration(longest) + pipeline.resolver->grace() +
           std::chrono::milliseconds(cadence_ms);
}

}  // namespace

TickScheduler::TickScheduler(SchedulerConfig config, std::vector<HorizonKey> horizons,
                             std::shared_ptr<Clock> clock, Pipeline pipeline)
    : config_(std::move(config)),
      horizons_(std::move(horizons)),
      clock_(std::move(clock)),
      pipeline_(std::move(pipeline)),
      history_(checked(pipeline_).features->make_history()),
      tape_(tape_retention(horizons_, pipeline_, config_.cadence_ms)) {
    if (!clock_) {
        throw std::invalid_argument("TickScheduler requires a clock");
    }
    if (horizons_.empty()) {
        throw std::invalid_argument("TickScheduler needs at least one horizon");
    }
    if (config_.cadence_ms <= 0 || config_.fetch_timeout_ms <= 0 || config_.model_timeout_ms <= 0) {
        throw std::invalid_argument("Scheduler intervals must be positive");
    }
    std::sort(horizons_.begin(), horizons_.end());

    auto& sm = StateManager::instance();
    std::vector<ComponentInfo> components = {
        {ComponentType::SCHEDULER, ComponentState::INITIALIZED, SCHEDULER_ID, "", clock_->now(), {}},
        {ComponentType::MARKET_DATA, ComponentState::INITIALIZED, pipeline_.source->name(), "",
         clock_->now(), {}},
        {ComponentType::RECORDER, ComponentState::INITIALIZED, RECORDER_ID, "", clock_->now(), {}}};
    for (const auto& runner : pipeline_.runners) {
        components.push_back(
            {ComponentType::MODEL, ComponentState::INITIALIZED, runner->id(), "", clock_->now(), {}});
    }
    for (const auto& info : components) {
        auto registered = sm.register_component(info);
        if (registered.is_error()) {
            WARN("Component registration failed: " << registered.error()->to_string());
        }
    }
}

TickScheduler::~TickScheduler() {
    for (auto& runner : pipeline_.runners) {
        runner->stop();
    }
}

void TickScheduler::report_component(const std::string& id, ComponentState state,
                                     const std::string& message) {
    auto updated = StateManager::instance().update_state(id, state, message);
    if (updated.is_error()) {
        DEBUG("State update ignored: " << updated.error()->to_string());
    }
}

std::chrono::milliseconds TickScheduler::retry_backoff(int attempt) const {
    std::chrono::milliseconds delay(config_.write_retry_backoff_ms);
    for (int i = 0; i < attempt && delay < MAX_BACKOFF; ++i) {
        delay *= 2;
    }
    return std::min(delay, MAX_BACKOFF);
}

Result<void> TickScheduler::start(const std::string& run_id, const nlohmann::json& run_config) {
    if (session_open_) {
        return Result<void>();
    }
    session_open_ = true;
    report_component(SCHEDULER_ID, ComponentState::RUNNING);
    report_component(RECORDER_ID, ComponentState::RUNNING);

    auto started = pipeline_.recorder->start_session(run_id, clock_->now(), run_config);
    if (started.is_error()) {
        enter_halt(started.error()->to_string());
        return started;
    }
    INFO("Session " << run_id << " started: cadence " << config_.cadence_ms << "ms, "
                    << pipeline_.runners.size() << " model(s), " << horizons_.size()
                    << " horizon(s), recording to " << pipeline_.recorder->csv_target());
    return Result<void>();
}

void TickScheduler::enter_halt(const std::string& why) {
    if (state_.load() != SchedulerState::HALTED) {
        ERROR("Store failure, halting new predictions: " << why);
    }
    state_.store(SchedulerState::HALTED);
    report_component(RECORDER_ID, ComponentState::ERR_STATE, why);
}

Result<void> TickScheduler::wait_out_halt() {
    for (int attempt = 0; attempt < config_.write_retry_max_attempts; ++attempt) {
        auto delay = retry_backoff(attempt);
        WARN("Store unavailable, retry " << (attempt + 1) << "/"
                                          << config_.write_retry_max_attempts << " in "
                                          << delay.count() << "ms ("
                                          << pipeline_.recorder->backlog_size()
                                          << " line(s) backlogged)");
        if (!clock_->sleep_until(clock_->now() + delay, stop_requested_)) {
            return Result<void>();
        }

        auto retried = pipeline_.recorder->retry_backlog();
        if (retried.is_ok()) {
            INFO("Store recovered after " << (attempt + 1) << " retr"
                                          << (attempt == 0 ? "y" : "ies")
                                          << "; resuming predictions");
            state_.store(SchedulerState::IDLE);
            report_component(RECORDER_ID, ComponentState::RUNNING);
            return Result<void>();
        }
    }

    std::string message = "Record store still failing after " +
                          std::to_string(config_.write_retry_max_attempts) + " retries";
    ERROR(message);
    for (const auto& info : StateManager::instance().components_in_error()) {
        ERROR("  " << info.id << ": " << info.error_message);
    }
    report_component(SCHEDULER_ID, ComponentState::ERR_STATE, message);
    return make_error<void>(ErrorCode::FILE_IO_ERROR, message, "TickScheduler");
}

Result<void> TickScheduler::run() {
    if (!session_open_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "start() has not been called",
                                "TickScheduler");
    }
    Logger::register_component(SCHEDULER_ID);

    const std::chrono::milliseconds cadence(config_.cadence_ms);
    Timestamp next = core::next_grid_instant(clock_->now(), cadence);

    while (!stop_requested()) {
        if (state_.load() == SchedulerState::HALTED) {
            auto recovered = wait_out_halt();
            if (recovered.is_error()) {
                store_lost_ = true;
                auto stopped = shutdown();
                if (stopped.is_error()) {
                    ERROR("Shutdown after store loss: " << stopped.error()->to_string());
                }
                return recovered;
            }
            next = core::next_grid_instant(clock_->now(), cadence);
            continue;
        }

        if (!clock_->sleep_until(next, stop_requested_)) {
            break;
        }

        TickReport report = run_tick(next);
        log_tick(report);

        Timestamp planned = next + cadence;
        Timestamp now = clock_->now();
        if (now >= planned) {
            Timestamp resumed = core::next_grid_instant(now, cadence);
            auto missed = static_cast<size_t>((resumed - planned) / cadence);
            skipped_ticks_ += missed;
            WARN("Tick " << core::to_iso8601_utc(next) << " overran the cadence; skipping "
                         << missed << " grid instant(s)");
            next = resumed;
        } else {
            next = planned;
        }
    }

    INFO("Stop requested, shutting down");
    return shutdown();
}

std::vector<ModelOutput> TickScheduler::fan_out(const FeatureVectorPtr& features,
                                                TickReport& report) {
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.model_timeout_ms);

    std::vector<std::future<ModelOutput>> futures;
    futures.reserve(pipeline_.runners.size());
    for (auto& runner : pipeline_.runners) {
        futures.push_back(runner->submit(features));
    }

    std::vector<ModelOutput> outputs;
    outputs.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        const auto& runner = pipeline_.runners[i];
        if (futures[i].wait_until(deadline) == std::future_status::ready) {
            outputs.push_back(futures[i].get());
        } else {
            EngineError late(ErrorCode::MODEL_UNAVAILABLE,
                             "timed out after " + std::to_string(config_.model_timeout_ms) + "ms",
                             runner->id());
            WARN(late.to_string());
            outputs.push_back(
                ModelOutput::all_unavailable(runner->id(), runner->horizons(), late.to_string()));
        }
    }

    for (const auto& output : outputs) {
        if (output.available_count() == 0) {
            std::string reason =
                output.by_horizon.empty() ? "no output" : output.by_horizon.begin()->second.reason;
            report.unavailable_models.push_back(output.model_id);
            report_component(output.model_id, ComponentState::ERR_STATE, reason);
            DEBUG("Model " << output.model_id << " unavailable: " << reason);
        } else {
            report_component(output.model_id, ComponentState::RUNNING);
            for (const auto& [h, est] : output.by_horizon) {
                if (est.is_available()) {
                    DEBUG("Model " << output.model_id << " " << h << "s p=" << *est.p);
                } else {
                    DEBUG("Model " << output.model_id << " " << h << "s unavailable: "
                                   << est.reason);
                }
            }
        }
    }
    return outputs;
}

size_t TickScheduler::resolve_pending(Timestamp current, TickReport& report, bool& store_failed) {
    auto events = pending_.resolve_all(*pipeline_.resolver, tape_, current);
    if (events.is_error()) {
        ERROR("Outcome resolution failed: " << events.error()->to_string());
        return 0;
    }

    for (const auto& event : events.value()) {
        if (event.outcome.status == OutcomeStatus::RESOLVED) {
            ++report.resolved;
        } else {
            ++report.expired;
        }
    }

    if (!events.value().empty()) {
        auto journaled = pipeline_.recorder->record_resolutions(events.value(), clock_->now());
        if (journaled.is_error()) {
            store_failed = true;
        }
    }

    auto finals = pending_.take_final();
    report.finalized = finals.size();
    if (!finals.empty()) {
        auto written = pipeline_.recorder->write_rows(finals);
        if (written.is_error()) {
            store_failed = true;
        }
    }
    return events.value().size();
}

TickReport TickScheduler::run_tick(Timestamp tick_time) {
    auto started = std::chrono::steady_clock::now();
    TickReport report;
    report.tick_time = tick_time;

    auto finish = [&report, &started, this]() {
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (state_.load() == SchedulerState::TICKING) {
            state_.store(SchedulerState::IDLE);
        }
        auto& sm = StateManager::instance();
        auto updated = sm.update_metrics(
            SCHEDULER_ID, {{"pending_rows", static_cast<double>(pending_.size())},
                           {"skipped_ticks", static_cast<double>(skipped_ticks_)},
                           {"last_tick_ms", static_cast<double>(report.elapsed.count())}});
        if (updated.is_error()) {
            DEBUG("Metrics update ignored: " << updated.error()->to_string());
        }
        return report;
    };

    if (state_.load() == SchedulerState::HALTED) {
        report.outcome = TickOutcome::HALTED;
        report.detail = "store unavailable";
        return finish();
    }
    state_.store(SchedulerState::TICKING);

    // 1. Snapshot
    auto fetched = pipeline_.source->fetch(std::chrono::milliseconds(config_.fetch_timeout_ms));
    if (fetched.is_error()) {
        report.outcome = TickOutcome::SKIPPED_NO_DATA;
        report.detail = fetched.error()->to_string();
        report_component(pipeline_.source->name(), ComponentState::ERR_STATE,
                         fetched.error()->what());
        return finish();
    }
    SnapshotPtr snapshot = fetched.value();
    report_component(pipeline_.source->name(), ComponentState::RUNNING);

    auto taped = tape_.record(snapshot->timestamp, snapshot->mid());
    if (taped.is_error()) {
        report.outcome = TickOutcome::SKIPPED_NO_DATA;
        report.detail = taped.error()->to_string();
        return finish();
    }

    // 2. Features from history as it stood before this tick, then extend history
    auto computed = pipeline_.features->compute(*snapshot, history_);
    auto pushed = history_.push(snapshot);
    if (pushed.is_error()) {
        WARN("History rejected snapshot: " << pushed.error()->to_string());
    }

    bool store_failed = false;

    if (computed.is_error()) {
        report.outcome = computed.error()->code() == ErrorCode::INSUFFICIENT_HISTORY
                             ? TickOutcome::SKIPPED_HISTORY
                             : TickOutcome::SKIPPED_NO_DATA;
        report.detail = computed.error()->to_string();
    } else {
        auto features = std::make_shared<const FeatureVector>(computed.take());

        // 3. Fan-out and combine
        std::vector<ModelOutput> outputs = fan_out(features, report);
        EnsemblePrediction blended = pipeline_.ensemble->combine(outputs, horizons_);

        PredictionRow row;
        row.sequence = next_sequence_;
        row.tick_time = tick_time;
        row.snapshot_time = snapshot->timestamp;
        row.wall_time = clock_->now();
        row.entry_mid = snapshot->mid();
        row.features = *features;
        row.model_outputs = std::move(outputs);
        row.ensemble = blended;
        for (HorizonKey h : horizons_) {
            row.outcomes[h] = HorizonOutcome{};
        }

        // 4. Journal, then track as pending
        auto journaled = pipeline_.recorder->record_prediction(row);
        if (journaled.is_error() && journaled.error()->code() == ErrorCode::DUPLICATE_RECORD) {
            ERROR("Prediction rejected: " << journaled.error()->to_string());
            report.outcome = TickOutcome::SKIPPED_DUPLICATE;
            report.detail = journaled.error()->to_string();
        } else {
            if (journaled.is_error()) {
                store_failed = true;
            }
            ++next_sequence_;
            pending_.add(std::move(row));
            report.outcome = TickOutcome::RECORDED;
            report.ensemble = std::move(blended);
        }
    }

    // 5. Resolve every pending row against this snapshot
    resolve_pending(snapshot->timestamp, report, store_failed);

    if (store_failed) {
        enter_halt("write failed during tick " + core::to_iso8601_utc(tick_time));
        report.outcome = TickOutcome::HALTED;
    }
    return finish();
}

void TickScheduler::log_tick(const TickReport& report) const {
    std::ostringstream fused;
    for (const auto& [h, blended] : report.ensemble) {
        fused << " p_fused_" << h << "s=";
        if (blended.raw.is_available()) {
            fused << *blended.raw.p;
        } else {
            fused << "NA";
        }
    }

    if (report.outcome == TickOutcome::RECORDED) {
        INFO("Tick " << core::to_iso8601_utc(report.tick_time) << " recorded" << fused.str()
                     << " resolved=" << report.resolved << " expired=" << report.expired
                     << " written=" << report.finalized << " pending=" << pending_.size()
                     << " (" << report.elapsed.count() << "ms)");
        if (!report.unavailable_models.empty()) {
            std::ostringstream names;
            for (const auto& id : report.unavailable_models) {
                names << " " << id;
            }
            WARN("Unavailable this tick:" << names.str());
        }
    } else if (report.outcome == TickOutcome::HALTED) {
        ERROR("Tick " << core::to_iso8601_utc(report.tick_time) << " halted: " << report.detail);
    } else {
        WARN("Tick " << core::to_iso8601_utc(report.tick_time) << " "
                     << tick_outcome_to_string(report.outcome) << ": " << report.detail
                     << " (resolved=" << report.resolved << " expired=" << report.expired << ")");
    }
}

Result<void> TickScheduler::shutdown() {
    if (state_.load() == SchedulerState::STOPPED) {
        return Result<void>();
    }

    Result<void> status;
    if (session_open_ && !store_lost_) {
        std::vector<PredictionRow> rows = pending_.drain();
        auto unresolved = static_cast<size_t>(std::count_if(
            rows.begin(), rows.end(), [](const PredictionRow& r) { return !r.is_final(); }));

        auto written = pipeline_.recorder->write_rows(rows);
        auto ended = pipeline_.recorder->end_session(clock_->now(), unresolved);
        if (written.is_error()) {
            status = std::move(written);
        } else if (ended.is_error()) {
            status = std::move(ended);
        }
        INFO("Shutdown wrote " << rows.size() << " remaining row(s), " << unresolved
                               << " with unresolved horizons");
    }

    for (auto& runner : pipeline_.runners) {
        runner->stop();
        report_component(runner->id(), ComponentState::STOPPED);
    }
    report_component(pipeline_.source->name(), ComponentState::STOPPED);
    report_component(RECORDER_ID, ComponentState::STOPPED);
    report_component(SCHEDULER_ID, ComponentState::STOPPED);
    state_.store(SchedulerState::STOPPED);
    return status;
}

}  // namespace signal_ngin
