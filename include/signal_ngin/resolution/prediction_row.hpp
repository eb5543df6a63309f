// include/signal_ngin/resolution/prediction_row.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/ensemble/ensemble_combiner.hpp"
#include "signal_ngin/features/feature_vector.hpp"

namespace signal_ngin {

enum class OutcomeStatus { PENDING, RESOLVED, EXPIRED };

enum class RowStatus { PENDING, PARTIAL, COMPLETE };

inline std::string outcome_status_to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::PENDING:
            return "pending";
        case OutcomeStatus::RESOLVED:
            return "resolved";
        case OutcomeStatus::EXPIRED:
            return "expired";
        default:
            return "unknown";
    }
}

inline std::string row_status_to_string(RowStatus status) {
    switch (status) {
        case RowStatus::PENDING:
            return "pending";
        case RowStatus::PARTIAL:
            return "partial";
        case RowStatus::COMPLETE:
            return "complete";
        default:
            return "unknown";
    }
}

/**
 * @brief Realised outcome of one horizon of one prediction
 */
struct HorizonOutcome {
    OutcomeStatus status{OutcomeStatus::PENDING};
    double realized_return{0.0};   // m1 / m0 - 1, set when RESOLVED
    bool realized_up{false};
    Timestamp exit_time;           // Snapshot used for the exit price
    Price exit_mid{0.0};
};

/**
 * @brief One tick's prediction and, over time, its realised outcomes
 *
 * Every horizon moves out of PENDING at most once.
 */
struct PredictionRow {
    uint64_t sequence{0};
    Timestamp tick_time;      // Scheduled grid instant
    Timestamp snapshot_time;  // Exchange time of the snapshot the prediction used
    Timestamp wall_time;      // Local time the row was created
    Price entry_mid{0.0};

    FeatureVector features;
    std::vector<ModelOutput> model_outputs;
    EnsemblePrediction ensemble;
    std::map<HorizonKey, HorizonOutcome> outcomes;

    /**
     * @brief Record a final outcome for a horizon
     * @return DUPLICATE_RECORD if the horizon already left PENDING, INVALID_ARGUMENT for
     * an unknown horizon or a PENDING outcome
     */
    Result<void> apply_outcome(HorizonKey horizon, const HorizonOutcome& outcome);

    RowStatus row_status() const;

    bool is_final() const {
        return row_status() == RowStatus::COMPLETE;
    }

    /**
     * @brief Estimate a model reported for a horizon; unavailable when the model is unknown
     */
    ProbabilityEstimate model_estimate(const std::string& model_id, HorizonKey horizon) const;
};

}  // namespace signal_ngin
