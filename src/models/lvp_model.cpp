// src/models/lvp_model.cpp

#include "signal_ngin/models/lvp_model.hpp"
#include <algorithm>
#include <cmath>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/probability.hpp"

namespace signal_ngin {

namespace {

statistics::KalmanFilterConfig drift_filter_config(const LVPConfig& config) {
    statistics::KalmanFilterConfig kf;
    kf.state_dim = 1;
    kf.obs_dim = 1;
    kf.process_noise = config.drift_process_noise;
    kf.measurement_noise = config.measurement_noise_floor;
    kf.initial_covariance = 1e-8;
    return kf;
}

}  // namespace

LVPModel::LVPModel(std::string id, std::vector<HorizonKey> horizons, LVPConfig config)
    : ModelBase(std::move(id), std::move(horizons), config.inputs),
      config_(std::move(config)),
      drift_filter_(drift_filter_config(config_)),
      garch_(config_.garch) {
    if (config_.min_returns < 2 || config_.max_gap_ms <= 0) {
        throw std::invalid_argument("Invalid LVP parameters for " + this->id());
    }

    const auto& indices = feature_indices();
    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] == static_cast<size_t>(Feature::OFI_W)) {
            ofi_position_ = static_cast<int>(i);
        }
    }

    auto init = drift_filter_.initialize(Eigen::VectorXd::Zero(1));
    if (init.is_error()) {
        throw std::runtime_error(init.error()->to_string());
    }
}

double LVPModel::drift() const {
    auto state = drift_filter_.get_state();
    return state.is_ok() ? state.value()(0) : 0.0;
}

Result<ModelOutput> LVPModel::score(const FeatureVector& features) const {
    if (garch_.observations() < static_cast<size_t>(config_.min_returns)) {
        return ModelOutput::all_unavailable(
            id(), horizons(),
            "warming up (" + std::to_string(garch_.observations()) + " returns)");
    }

    double ofi_term = 0.0;
    if (ofi_position_ >= 0) {
        auto row = design_row(features);
        if (row.is_error()) {
            return forward_error<ModelOutput>(row, "LVP");
        }
        ofi_term = config_.ofi_beta * std::tanh(row.value()(ofi_position_));
    }

    double mu = drift();

    ModelOutput out;
    out.model_id = id();
    for (HorizonKey h : horizons()) {
        auto cumulative = garch_.forecast_cumulative(h);
        if (cumulative.is_error()) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable(cumulative.error()->what());
            continue;
        }
        double sigma_h = std::sqrt(cumulative.value());
        if (!(sigma_h > 0.0) || !std::isfinite(sigma_h)) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable("zero volatility");
            continue;
        }
        double z = mu * h / sigma_h + ofi_term;
        out.by_horizon[h] = ProbabilityEstimate::of(statistics::normal_cdf(z));
    }
    return out;
}

Result<void> LVPModel::update(const FeatureVector& features) {
    if (has_last_) {
        double dt = std::chrono::duration<double>(features.timestamp - last_time_).count();
        bool usable = dt > 0.0 && dt * 1000.0 <= config_.max_gap_ms && last_mid_ > 0.0 &&
                      features.mid > 0.0;
        if (usable) {
            double r = std::log(features.mid / last_mid_);
            auto garch_update = garch_.update(r / std::sqrt(dt));
            if (garch_update.is_error()) {
                return garch_update;
            }

            // Drift observation r/dt has variance sigma^2/dt
            double var = config_.measurement_noise_floor;
            auto current = garch_.get_variance();
            if (current.is_ok()) {
                var = std::max(current.value() / dt, config_.measurement_noise_floor);
            }
            drift_filter_.set_process_noise(
                Eigen::MatrixXd::Constant(1, 1, config_.drift_process_noise * dt));
            drift_filter_.set_measurement_noise(Eigen::MatrixXd::Constant(1, 1, var));

            auto predicted = drift_filter_.predict();
            if (predicted.is_error()) {
                return forward_error<void>(predicted, "LVP");
            }
            auto filtered = drift_filter_.update(Eigen::VectorXd::Constant(1, r / dt));
            if (filtered.is_error()) {
                return forward_error<void>(filtered, "LVP");
            }
        } else {
            DEBUG("LVP " << id() << " skipped a return over a " << dt << "s gap");
        }
    }

    has_last_ = true;
    last_time_ = features.timestamp;
    last_mid_ = features.mid;
    return observe(features);
}

}  // namespace signal_ngin
