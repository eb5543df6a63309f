// src/models/rrf_model.cpp

#include "signal_ngin/models/rrf_model.hpp"
#include <cmath>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/probability.hpp"

namespace signal_ngin {

RRFModel::RRFModel(std::string id, std::vector<HorizonKey> horizons, RRFConfig config)
    : ModelBase(std::move(id), std::move(horizons), config.inputs), config_(std::move(config)) {
    if (!(config_.forgetting_factor > 0.0 && config_.forgetting_factor <= 1.0)) {
        throw std::invalid_argument("RRF forgetting_factor must lie in (0, 1]");
    }
    if (!(config_.ridge_lambda > 0.0) || !(config_.residual_halflife > 0.0) ||
        config_.min_samples < 1) {
        throw std::invalid_argument("Invalid RRF parameters for " + this->id());
    }
    residual_decay_ = std::pow(0.5, 1.0 / config_.residual_halflife);

    for (HorizonKey h : this->horizons()) {
        HorizonState state{Eigen::VectorXd(), Eigen::MatrixXd(), 0.0, 0,
                           LabelBuffer(horizon_duration(h),
                                       std::chrono::milliseconds(config_.max_label_delay_ms))};
        reset(state);
        states_.emplace(h, std::move(state));
    }
}

void RRFModel::reset(HorizonState& state) const {
    state.theta = Eigen::VectorXd::Zero(design_dim());
    state.P = Eigen::MatrixXd::Identity(design_dim(), design_dim()) / config_.ridge_lambda;
    state.residual_var = 0.0;
    state.samples = 0;
}

Result<ModelOutput> RRFModel::score(const FeatureVector& features) const {
    auto row = design_row(features);
    if (row.is_error()) {
        return forward_error<ModelOutput>(row, "RRF");
    }

    ModelOutput out;
    out.model_id = id();
    for (const auto& [h, state] : states_) {
        if (state.samples < static_cast<size_t>(config_.min_samples)) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable(
                "warming up (" + std::to_string(state.samples) + " samples)");
            continue;
        }
        double s = std::sqrt(state.residual_var);
        if (!(s > 0.0)) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable("zero residual variance");
            continue;
        }
        double y_hat = state.theta.dot(row.value());
        out.by_horizon[h] = ProbabilityEstimate::of(statistics::normal_cdf(y_hat / s));
    }
    return out;
}

Result<void> RRFModel::train(HorizonState& state, const LabeledSample& sample) {
    const double lambda = config_.forgetting_factor;
    const Eigen::VectorXd& x = sample.x;

    double error = sample.y - state.theta.dot(x);
    Eigen::VectorXd Px = state.P * x;
    double denom = lambda + x.dot(Px);
    if (!(denom > 0.0) || !std::isfinite(denom)) {
        return make_error<void>(ErrorCode::NUMERICAL_ERROR, "RLS gain denominator not positive",
                                "RRF");
    }

    Eigen::VectorXd gain = Px / denom;
    Eigen::VectorXd theta = state.theta + gain * error;
    Eigen::MatrixXd P = (state.P - gain * Px.transpose()) / lambda;
    P = 0.5 * (P + P.transpose());

    if (!theta.allFinite() || !P.allFinite()) {
        return make_error<void>(ErrorCode::NUMERICAL_ERROR, "RLS state became non-finite", "RRF");
    }

    state.theta = std::move(theta);
    state.P = std::move(P);

    double sq = error * error;
    state.residual_var = state.samples == 0
                             ? sq
                             : residual_decay_ * state.residual_var + (1.0 - residual_decay_) * sq;
    ++state.samples;
    return Result<void>();
}

Result<void> RRFModel::update(const FeatureVector& features) {
    auto row = design_row(features);
    if (row.is_error()) {
        return forward_error<void>(row, "RRF");
    }

    for (auto& [h, state] : states_) {
        for (const auto& sample : state.labels.harvest(features.timestamp, features.mid)) {
            auto trained = train(state, sample);
            if (trained.is_error()) {
                WARN("RRF " << id() << " horizon " << h << "s reset: "
                            << trained.error()->what());
                reset(state);
                break;
            }
        }
        state.labels.push(features.timestamp, features.mid, row.value());
    }
    return observe(features);
}

size_t RRFModel::samples(HorizonKey horizon) const {
    auto it = states_.find(horizon);
    return it == states_.end() ? 0 : it->second.samples;
}

Result<Eigen::VectorXd> RRFModel::coefficients(HorizonKey horizon) const {
    auto it = states_.find(horizon);
    if (it == states_.end()) {
        return make_error<Eigen::VectorXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Unknown horizon " + std::to_string(horizon), "RRF");
    }
    return Result<Eigen::VectorXd>(it->second.theta);
}

}  // namespace signal_ngin
