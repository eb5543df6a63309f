// src/ensemble/ensemble_combiner.cpp

#include "signal_ngin/ensemble/ensemble_combiner.hpp"
#include <cmath>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/probability.hpp"

namespace signal_ngin {

EnsembleCombiner::EnsembleCombiner(EnsembleConfig config) : config_(std::move(config)) {
    for (const auto& [id, w] : config_.weights) {
        if (!(w >= 0.0) || !std::isfinite(w)) {
            throw std::invalid_argument("Weight for " + id + " must be finite and non-negative");
        }
    }
    if (!(config_.calibration_temperature > 0.0)) {
        throw std::invalid_argument("calibration_temperature must be positive");
    }
    if (!(config_.probability_floor >= 0.0 && config_.probability_floor < 0.5)) {
        throw std::invalid_argument("probability_floor must lie in [0, 0.5)");
    }
}

double EnsembleCombiner::weight_of(const std::string& model_id) const {
    auto it = config_.weights.find(model_id);
    // Models absent from the weight table count equally
    return it == config_.weights.end() ? 1.0 : it->second;
}

Result<double> EnsembleCombiner::blend(
    const std::vector<std::pair<double, double>>& weighted) const {
    double total_weight = 0.0;
    double acc = 0.0;
    for (const auto& [w, p] : weighted) {
        if (!(w > 0.0)) {
            continue;
        }
        total_weight += w;
        acc += config_.rule == CombinationRule::WEIGHTED_LOG_ODDS ? w * statistics::logit(p)
                                                                  : w * p;
    }
    if (!(total_weight > 0.0)) {
        return make_error<double>(ErrorCode::ENSEMBLE_UNRESOLVABLE,
                                  "No available component with positive weight",
                                  "EnsembleCombiner");
    }

    double blended = acc / total_weight;
    if (config_.rule == CombinationRule::WEIGHTED_LOG_ODDS) {
        blended = statistics::sigmoid(blended);
    }
    return blended;
}

double EnsembleCombiner::calibrate(double p) const {
    double scaled = statistics::sigmoid(statistics::logit(p) / config_.calibration_temperature);
    return statistics::clamp_probability(scaled, config_.probability_floor);
}

EnsemblePrediction EnsembleCombiner::combine(const std::vector<ModelOutput>& outputs,
                                             const std::vector<HorizonKey>& horizons) const {
    EnsemblePrediction prediction;

    for (HorizonKey h : horizons) {
        BlendedProbability blended;
        std::vector<std::pair<double, double>> weighted;

        for (const auto& output : outputs) {
            ProbabilityEstimate est = output.at(h);
            double w = weight_of(output.model_id);
            if (est.is_available() && w > 0.0) {
                weighted.emplace_back(w, *est.p);
                blended.contributors.push_back(output.model_id);
            }
        }

        auto p = blend(weighted);
        if (p.is_error()) {
            WARN("Horizon " << h << "s unresolvable: " << p.error()->what());
            blended.raw = ProbabilityEstimate::unavailable(p.error()->to_string());
            blended.calibrated = blended.raw;
        } else {
            blended.raw = ProbabilityEstimate::of(p.value());
            blended.calibrated = blended.raw.is_available()
                                     ? ProbabilityEstimate::of(calibrate(p.value()))
                                     : blended.raw;
        }
        prediction[h] = std::move(blended);
    }
    return prediction;
}

}  // namespace signal_ngin
