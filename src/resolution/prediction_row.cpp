// src/resolution/prediction_row.cpp

#include "signal_ngin/resolution/prediction_row.hpp"

namespace signal_ngin {

Result<void> PredictionRow::apply_outcome(HorizonKey horizon, const HorizonOutcome& outcome) {
    auto it = outcomes.find(horizon);
    if (it == outcomes.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Row has no horizon " + std::to_string(horizon) + "s",
                                "PredictionRow");
    }
    if (outcome.status == OutcomeStatus::PENDING) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "A pending outcome cannot be applied", "PredictionRow");
    }
    if (it->second.status != OutcomeStatus::PENDING) {
        return make_error<void>(ErrorCode::DUPLICATE_RECORD,
                                "Horizon " + std::to_string(horizon) + "s of row " +
                                    std::to_string(sequence) + " is already " +
                                    outcome_status_to_string(it->second.status),
                                "PredictionRow");
    }
    it->second = outcome;
    return Result<void>();
}

RowStatus PredictionRow::row_status() const {
    size_t done = 0;
    for (const auto& [h, outcome] : outcomes) {
        if (outcome.status != OutcomeStatus::PENDING)
            ++done;
    }
    if (done == 0)
        return RowStatus::PENDING;
    return done == outcomes.size() ? RowStatus::COMPLETE : RowStatus::PARTIAL;
}

ProbabilityEstimate PredictionRow::model_estimate(const std::string& model_id,
                                                  HorizonKey horizon) const {
    for (const auto& output : model_outputs) {
        if (output.model_id == model_id) {
            return output.at(horizon);
        }
    }
    return ProbabilityEstimate::unavailable("model did not report");
}

}  // namespace signal_ngin
