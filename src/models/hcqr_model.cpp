// src/models/hcqr_model.cpp

#include "signal_ngin/models/hcqr_model.hpp"
#include <algorithm>
#include <cmath>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

HCQRModel::HCQRModel(std::string id, std::vector<HorizonKey> horizons, HCQRConfig config)
    : ModelBase(std::move(id), std::move(horizons), config.inputs), config_(std::move(config)) {
    if (!(config_.learning_rate > 0.0) || config_.min_samples < 1 ||
        !(config_.scale_halflife > 0.0)) {
        throw std::invalid_argument("Invalid HCQR parameters for " + this->id());
    }
    if (!(config_.probability_floor >= 0.0 && config_.probability_floor < 0.5)) {
        throw std::invalid_argument("HCQR probability_floor must lie in [0, 0.5)");
    }
    scale_decay_ = std::pow(0.5, 1.0 / config_.scale_halflife);

    for (HorizonKey h : this->horizons()) {
        states_.emplace(h, HorizonState{Eigen::MatrixXd::Zero(QUANTILES.size(), design_dim()),
                                        0.0, 0,
                                        LabelBuffer(horizon_duration(h),
                                                    std::chrono::milliseconds(
                                                        config_.max_label_delay_ms))});
    }
}

double HCQRModel::prob_up_from_quantiles(std::array<double, 5> q, double floor) {
    // Rearrangement: sorting repairs quantile crossing
    std::sort(q.begin(), q.end());

    double cdf_at_zero;
    if (0.0 < q.front()) {
        cdf_at_zero = 0.0;
    } else if (0.0 >= q.back()) {
        cdf_at_zero = 1.0;
    } else {
        cdf_at_zero = QUANTILES.back();
        for (size_t k = 0; k + 1 < q.size(); ++k) {
            if (q[k] <= 0.0 && 0.0 < q[k + 1]) {
                double frac = (0.0 - q[k]) / (q[k + 1] - q[k]);
                cdf_at_zero = QUANTILES[k] + frac * (QUANTILES[k + 1] - QUANTILES[k]);
                break;
            }
        }
    }
    double p = 1.0 - cdf_at_zero;
    return std::min(std::max(p, floor), 1.0 - floor);
}

Result<ModelOutput> HCQRModel::score(const FeatureVector& features) const {
    auto row = design_row(features);
    if (row.is_error()) {
        return forward_error<ModelOutput>(row, "HCQR");
    }

    ModelOutput out;
    out.model_id = id();
    for (const auto& [h, state] : states_) {
        if (state.samples < static_cast<size_t>(config_.min_samples)) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable(
                "warming up (" + std::to_string(state.samples) + " samples)");
            continue;
        }
        Eigen::VectorXd q = state.weights * row.value();
        std::array<double, 5> quantiles;
        for (size_t k = 0; k < quantiles.size(); ++k) {
            quantiles[k] = q(k);
        }
        if (!q.allFinite()) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable("non-finite quantile");
            continue;
        }
        if (q.maxCoeff() - q.minCoeff() <= 1e-12) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable("degenerate quantile spread");
            continue;
        }
        out.by_horizon[h] =
            ProbabilityEstimate::of(prob_up_from_quantiles(quantiles, config_.probability_floor));
    }
    return out;
}

void HCQRModel::train(HorizonState& state, const LabeledSample& sample) {
    double alpha = 1.0 - scale_decay_;
    double scale_sq = state.samples == 0
                          ? sample.y * sample.y
                          : scale_decay_ * state.scale_sq + alpha * sample.y * sample.y;

    double scale = std::sqrt(state.scale_sq);
    if (state.samples > 0 && scale > 0.0) {
        double y = sample.y / scale;
        for (size_t k = 0; k < QUANTILES.size(); ++k) {
            double pred = state.weights.row(k).dot(sample.x);
            // Subgradient of the pinball loss
            double g = (y < pred ? 1.0 : 0.0) - QUANTILES[k];
            state.weights.row(k) -= config_.learning_rate * g * sample.x.transpose();
        }
    }
    state.scale_sq = scale_sq;
    ++state.samples;
}

Result<void> HCQRModel::update(const FeatureVector& features) {
    auto row = design_row(features);
    if (row.is_error()) {
        return forward_error<void>(row, "HCQR");
    }

    for (auto& [h, state] : states_) {
        for (const auto& sample : state.labels.harvest(features.timestamp, features.mid)) {
            train(state, sample);
        }
        if (!state.weights.allFinite()) {
            WARN("HCQR " << id() << " weights diverged at horizon " << h << "s; resetting");
            state.weights.setZero();
            state.samples = 0;
            state.scale_sq = 0.0;
        }
        state.labels.push(features.timestamp, features.mid, row.value());
    }
    return observe(features);
}

size_t HCQRModel::samples(HorizonKey horizon) const {
    auto it = states_.find(horizon);
    return it == states_.end() ? 0 : it->second.samples;
}

}  // namespace signal_ngin
