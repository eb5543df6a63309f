// src/storage/journal.cpp

#include "signal_ngin/storage/journal.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

nlohmann::json JournalFormat::probability(const ProbabilityEstimate& est) {
    if (est.is_available()) {
        return *est.p;
    }
    return {{"p", nullptr}, {"reason", est.reason}};
}

nlohmann::json JournalFormat::session_start(const std::string& run_id, Timestamp wall_time,
                                            const std::vector<std::string>& columns,
                                            const nlohmann::json& config) {
    nlohmann::json j;
    j["event"] = "session_start";
    j["wall_time"] = core::to_iso8601_utc(wall_time);
    j["run_id"] = run_id;
    j["columns"] = columns;
    j["config"] = config;
    return j;
}

nlohmann::json JournalFormat::prediction(const PredictionRow& row) {
    nlohmann::json j;
    j["event"] = "prediction";
    j["wall_time"] = core::to_iso8601_utc(row.wall_time);
    j["sequence"] = row.sequence;
    j["tick_ts_ms"] = core::to_epoch_ms(row.tick_time);
    j["snapshot_ts_ms"] = core::to_epoch_ms(row.snapshot_time);
    j["entry_mid"] = row.entry_mid;

    nlohmann::json features = nlohmann::json::object();
    const auto& names = feature_names();
    for (size_t i = 0; i < names.size(); ++i) {
        features[names[i]] = row.features.values[i];
    }
    j["features"] = features;

    nlohmann::json models = nlohmann::json::object();
    for (const auto& output : row.model_outputs) {
        nlohmann::json per_h = nlohmann::json::object();
        for (const auto& [h, est] : output.by_horizon) {
            per_h[std::to_string(h)] = probability(est);
        }
        models[output.model_id] = per_h;
    }
    j["models"] = models;

    nlohmann::json fused = nlohmann::json::object();
    for (const auto& [h, blended] : row.ensemble) {
        fused[std::to_string(h)] = {{"p", probability(blended.raw)},
                                    {"p_cal", probability(blended.calibrated)},
                                    {"contributors", blended.contributors}};
    }
    j["fused"] = fused;
    return j;
}

nlohmann::json JournalFormat::resolution(const ResolutionEvent& event, Timestamp wall_time) {
    nlohmann::json j;
    bool resolved = event.outcome.status == OutcomeStatus::RESOLVED;
    j["event"] = resolved ? "resolution" : "expiry";
    j["wall_time"] = core::to_iso8601_utc(wall_time);
    j["sequence"] = event.sequence;
    j["tick_ts_ms"] = core::to_epoch_ms(event.tick_time);
    j["horizon_s"] = event.horizon;
    j["status"] = outcome_status_to_string(event.outcome.status);
    if (resolved) {
        j["realized_ret"] = event.outcome.realized_return;
        j["realized_up"] = event.outcome.realized_up;
        j["exit_ts_ms"] = core::to_epoch_ms(event.outcome.exit_time);
        j["exit_mid"] = event.outcome.exit_mid;
    } else {
        j["error"] = event.gap;
    }
    return j;
}

nlohmann::json JournalFormat::session_end(Timestamp wall_time, size_t rows_written,
                                          size_t rows_left_pending) {
    nlohmann::json j;
    j["event"] = "session_end";
    j["wall_time"] = core::to_iso8601_utc(wall_time);
    j["rows_written"] = rows_written;
    j["rows_left_pending"] = rows_left_pending;
    return j;
}

}  // namespace signal_ngin
