// include/signal_ngin/ensemble/ensemble_combiner.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

enum class CombinationRule {
    WEIGHTED_MEAN,      // sum(w_i * p_i) / sum(w_i)
    WEIGHTED_LOG_ODDS   // sigmoid(sum(w_i * logit(p_i)) / sum(w_i))
};

inline std::string combination_rule_to_string(CombinationRule rule) {
    switch (rule) {
        case CombinationRule::WEIGHTED_MEAN:
            return "WEIGHTED_MEAN";
        case CombinationRule::WEIGHTED_LOG_ODDS:
            return "WEIGHTED_LOG_ODDS";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Ensemble settings
 */
struct EnsembleConfig : public ConfigBase {
    CombinationRule rule{CombinationRule::WEIGHTED_MEAN};
    std::map<std::string, double> weights;  // Filled from the model set
    double calibration_temperature{1.0};
    double probability_floor{0.01};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["rule"] = combination_rule_to_string(rule);
        j["weights"] = weights;
        j["calibration_temperature"] = calibration_temperature;
        j["probability_floor"] = probability_floor;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("rule")) {
            std::string r = j.at("rule").get<std::string>();
            if (r == "WEIGHTED_MEAN")
                rule = CombinationRule::WEIGHTED_MEAN;
            else if (r == "WEIGHTED_LOG_ODDS")
                rule = CombinationRule::WEIGHTED_LOG_ODDS;
            else
                throw std::invalid_argument("Unknown combination rule: " + r);
        }
        if (j.contains("weights"))
            weights = j.at("weights").get<std::map<std::string, double>>();
        if (j.contains("calibration_temperature"))
            calibration_temperature = j.at("calibration_temperature").get<double>();
        if (j.contains("probability_floor"))
            probability_floor = j.at("probability_floor").get<double>();
    }
};

/**
 * @brief Blended probability for one horizon
 */
struct BlendedProbability {
    ProbabilityEstimate raw;
    ProbabilityEstimate calibrated;
    std::vector<std::string> contributors;  // Models whose estimate entered the blend
};

using EnsemblePrediction = std::map<HorizonKey, BlendedProbability>;

/**
 * @brief Merges per-model estimates into one probability per horizon
 *
 * Each horizon is combined independently over the models that reported an estimate for
 * it, with weights renormalised over those models. When no weighted model is available
 * the horizon stays unavailable.
 */
class EnsembleCombiner {
public:
    /**
     * @throws std::invalid_argument for negative weights, a non-positive temperature or a
     * floor outside [0, 0.5)
     */
    explicit EnsembleCombiner(EnsembleConfig config);

    EnsemblePrediction combine(const std::vector<ModelOutput>& outputs,
                               const std::vector<HorizonKey>& horizons) const;

    /**
     * @brief Combine the available estimates of one horizon
     * @return ENSEMBLE_UNRESOLVABLE when nothing with positive weight is available
     */
    Result<double> blend(const std::vector<std::pair<double, double>>& weighted) const;

    /**
     * @brief Temperature-scaled calibration map clamped to [floor, 1 - floor]
     */
    double calibrate(double p) const;

    double weight_of(const std::string& model_id) const;

    const EnsembleConfig& config() const {
        return config_;
    }

private:
    EnsembleConfig config_;
};

}  // namespace signal_ngin
