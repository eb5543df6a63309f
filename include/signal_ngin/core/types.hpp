// include/signal_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace signal_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Forecast horizon, expressed in whole seconds (10, 30, 60)
 */
using HorizonKey = int;

inline std::chrono::milliseconds horizon_duration(HorizonKey horizon_s) {
    return std::chrono::milliseconds(static_cast<int64_t>(horizon_s) * 1000);
}

/**
 * @brief Directional probability for one horizon, or an explicit unavailable marker
 *
 * An unavailable estimate carries the reason instead of a placeholder value, so that
 * downstream code can never mistake it for a real 0.5.
 */
struct ProbabilityEstimate {
    std::optional<double> p;
    std::string reason;

    /**
     * @brief Build an available estimate
     * Values that are not finite or fall outside [0, 1] become unavailable.
     */
    static ProbabilityEstimate of(double value) {
        ProbabilityEstimate est;
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            est.reason = "ill-formed probability";
            return est;
        }
        est.p = value;
        return est;
    }

    static ProbabilityEstimate unavailable(std::string why) {
        ProbabilityEstimate est;
        est.reason = std::move(why);
        return est;
    }

    bool is_available() const {
        return p.has_value();
    }
};

using HorizonProbabilities = std::map<HorizonKey, ProbabilityEstimate>;

/**
 * @brief Output of one model component for one tick
 */
struct ModelOutput {
    std::string model_id;
    HorizonProbabilities by_horizon;

    static ModelOutput all_unavailable(const std::string& id,
                                       const std::vector<HorizonKey>& horizons,
                                       const std::string& reason) {
        ModelOutput out;
        out.model_id = id;
        for (HorizonKey h : horizons) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable(reason);
        }
        return out;
    }

    /**
     * @brief Estimate for a horizon; a horizon the model never reported is unavailable
     */
    ProbabilityEstimate at(HorizonKey horizon) const {
        auto it = by_horizon.find(horizon);
        if (it == by_horizon.end()) {
            return ProbabilityEstimate::unavailable("horizon not reported");
        }
        return it->second;
    }

    size_t available_count() const {
        size_t n = 0;
        for (const auto& [h, est] : by_horizon) {
            if (est.is_available())
                ++n;
        }
        return n;
    }
};

}  // namespace signal_ngin
