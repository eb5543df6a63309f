// include/signal_ngin/statistics/probability.hpp
#pragma once

#include <algorithm>
#include <cmath>

namespace signal_ngin {
namespace statistics {

/**
 * @brief Standard normal CDF
 */
inline double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

/**
 * @brief Log-odds; p is clipped away from 0 and 1 first
 */
inline double logit(double p, double eps = 1e-9) {
    double q = std::min(std::max(p, eps), 1.0 - eps);
    return std::log(q / (1.0 - q));
}

inline double sigmoid(double x) {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    double e = std::exp(x);
    return e / (1.0 + e);
}

inline double clamp_probability(double p, double floor) {
    return std::min(std::max(p, floor), 1.0 - floor);
}

}  // namespace statistics
}  // namespace signal_ngin
