// src/statistics/statistics_tools.cpp

#include "signal_ngin/statistics/statistics_tools.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace signal_ngin {
namespace statistics {

// ============================================================================
// Feature Standardizer Implementation
// ============================================================================

FeatureStandardizer::FeatureStandardizer(size_t dim, StandardizerConfig config)
    : dim_(dim), config_(config) {
    if (dim_ == 0) {
        throw std::invalid_argument("FeatureStandardizer needs at least one feature");
    }
    if (!(config_.halflife > 0.0) || !(config_.clip > 0.0)) {
        throw std::invalid_argument("Standardizer halflife and clip must be positive");
    }
    decay_ = std::pow(0.5, 1.0 / config_.halflife);
    mean_ = Eigen::VectorXd::Zero(dim_);
    var_ = Eigen::VectorXd::Zero(dim_);
}

Result<Eigen::VectorXd> FeatureStandardizer::transform(const Eigen::VectorXd& x) const {
    if (static_cast<size_t>(x.size()) != dim_) {
        return make_error<Eigen::VectorXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Feature dimension mismatch", "FeatureStandardizer");
    }

    Eigen::VectorXd z = Eigen::VectorXd::Zero(dim_);
    if (!is_warm()) {
        return z;
    }

    for (size_t i = 0; i < dim_; ++i) {
        double sd = std::sqrt(std::max(var_(i), config_.min_variance));
        double value = (x(i) - mean_(i)) / sd;
        z(i) = std::min(std::max(value, -config_.clip), config_.clip);
    }
    return z;
}

Result<void> FeatureStandardizer::update(const Eigen::VectorXd& x) {
    if (static_cast<size_t>(x.size()) != dim_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Feature dimension mismatch",
                                "FeatureStandardizer");
    }
    if (!x.allFinite()) {
        return make_error<void>(ErrorCode::NUMERICAL_ERROR, "Non-finite feature value",
                                "FeatureStandardizer");
    }

    if (count_ == 0) {
        mean_ = x;
        var_.setZero();
    } else {
        double alpha = 1.0 - decay_;
        Eigen::VectorXd diff = x - mean_;
        mean_ += alpha * diff;
        var_ = decay_ * (var_ + alpha * diff.cwiseProduct(diff));
    }
    ++count_;
    return Result<void>();
}

// ============================================================================
// GARCH Implementation
// ============================================================================

GARCH::GARCH(GARCHConfig config) : config_(config), alpha_(config.alpha), beta_(config.beta) {
    if (config_.min_observations < 2 || config_.max_window < config_.min_observations) {
        throw std::invalid_argument("GARCH window must hold at least min_observations >= 2");
    }
}

double GARCH::sample_variance() const {
    if (returns_.size() <= 1) {
        return 0.0;
    }
    double mean = std::accumulate(returns_.begin(), returns_.end(), 0.0) / returns_.size();
    double sum_sq = 0.0;
    for (double r : returns_) {
        sum_sq += (r - mean) * (r - mean);
    }
    return sum_sq / (returns_.size() - 1);
}

Result<void> GARCH::update(double new_return) {
    if (!std::isfinite(new_return)) {
        return make_error<void>(ErrorCode::NUMERICAL_ERROR, "Non-finite return", "GARCH");
    }

    returns_.push_back(new_return);
    while (returns_.size() > static_cast<size_t>(config_.max_window)) {
        returns_.pop_front();
    }
    ++observed_;

    if (!fitted_) {
        if (observed_ >= static_cast<size_t>(config_.min_observations)) {
            estimate_parameters();
        }
        return Result<void>();
    }

    conditional_variance_ =
        omega_ + alpha_ * new_return * new_return + beta_ * conditional_variance_;
    if (++since_fit_ >= static_cast<size_t>(config_.refit_interval)) {
        estimate_parameters();
    }
    return Result<void>();
}

void GARCH::estimate_parameters() {
    double unconditional_var = sample_variance();

    omega_ = unconditional_var * (1.0 - config_.alpha - config_.beta);
    alpha_ = config_.alpha;
    beta_ = config_.beta;

    // Ensure stationarity constraint: alpha + beta < 1
    if (alpha_ + beta_ >= 1.0) {
        alpha_ = 0.1;
        beta_ = 0.85;
        omega_ = unconditional_var * 0.05;
    }

    double best_ll = log_likelihood(omega_, alpha_, beta_);

    for (double a = 0.05; a <= 0.3; a += 0.05) {
        for (double b = 0.6; b <= 0.9; b += 0.05) {
            if (a + b < 0.995) {
                double w = unconditional_var * (1.0 - a - b);
                double ll = log_likelihood(w, a, b);
                if (ll > best_ll) {
                    best_ll = ll;
                    omega_ = w;
                    alpha_ = a;
                    beta_ = b;
                }
            }
        }
    }

    // Run the recursion over the window to obtain the next-step variance
    double h = unconditional_var;
    for (double r : returns_) {
        h = omega_ + alpha_ * r * r + beta_ * h;
    }
    conditional_variance_ = h;
    since_fit_ = 0;
    fitted_ = true;
}

double GARCH::log_likelihood(double omega, double alpha, double beta) const {
    double h = sample_variance();
    if (h <= 0.0) {
        return -std::numeric_limits<double>::infinity();
    }

    double ll = 0.0;
    for (size_t t = 0; t < returns_.size(); ++t) {
        if (t > 0) {
            double prev = returns_[t - 1];
            h = omega + alpha * prev * prev + beta * h;
        }
        if (h <= 0.0)
            return -std::numeric_limits<double>::infinity();
        ll += -0.5 * (std::log(2.0 * M_PI) + std::log(h) + returns_[t] * returns_[t] / h);
    }
    return ll;
}

Result<double> GARCH::get_variance() const {
    if (observed_ < 2) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED,
                                  "GARCH needs at least two returns", "GARCH");
    }
    return fitted_ ? conditional_variance_ : sample_variance();
}

Result<double> GARCH::forecast_cumulative(int n_periods) const {
    if (n_periods <= 0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "n_periods must be positive",
                                  "GARCH");
    }
    auto current = get_variance();
    if (current.is_error()) {
        return current;
    }
    if (!fitted_) {
        return current.value() * n_periods;
    }

    double h = current.value();
    double total = 0.0;
    for (int i = 0; i < n_periods; ++i) {
        total += h;
        h = omega_ + (alpha_ + beta_) * h;
    }
    return total;
}

// ============================================================================
// Kalman Filter Implementation
// ============================================================================

KalmanFilter::KalmanFilter(KalmanFilterConfig config) : config_(config) {
    F_ = Eigen::MatrixXd::Identity(config.state_dim, config.state_dim);
    H_ = Eigen::MatrixXd::Identity(config.obs_dim, config.state_dim);
    Q_ = Eigen::MatrixXd::Identity(config.state_dim, config.state_dim) * config.process_noise;
    R_ = Eigen::MatrixXd::Identity(config.obs_dim, config.obs_dim) * config.measurement_noise;
}

Result<void> KalmanFilter::initialize(const Eigen::VectorXd& initial_state) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initial_state.size() != config_.state_dim) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Initial state dimension mismatch",
                                "KalmanFilter");
    }

    x_ = initial_state;
    P_ = Eigen::MatrixXd::Identity(config_.state_dim, config_.state_dim) *
         config_.initial_covariance;
    initialized_ = true;

    return Result<void>();
}

Result<Eigen::VectorXd> KalmanFilter::predict() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return make_error<Eigen::VectorXd>(ErrorCode::NOT_INITIALIZED,
                                           "Kalman filter has not been initialized",
                                           "KalmanFilter");
    }

    // Predict state: x_k|k-1 = F * x_k-1|k-1
    x_ = F_ * x_;

    // Predict covariance: P_k|k-1 = F * P_k-1|k-1 * F^T + Q
    P_ = F_ * P_ * F_.transpose() + Q_;

    return Result<Eigen::VectorXd>(x_);
}

Result<Eigen::VectorXd> KalmanFilter::update(const Eigen::VectorXd& observation) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return make_error<Eigen::VectorXd>(ErrorCode::NOT_INITIALIZED,
                                           "Kalman filter has not been initialized",
                                           "KalmanFilter");
    }

    if (observation.size() != config_.obs_dim) {
        return make_error<Eigen::VectorXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Observation dimension mismatch", "KalmanFilter");
    }

    // Innovation: y = z - H * x_k|k-1
    Eigen::VectorXd y = observation - H_ * x_;

    // Innovation covariance: S = H * P_k|k-1 * H^T + R
    Eigen::MatrixXd S = H_ * P_ * H_.transpose() + R_;

    // Kalman gain K = P*H' * S^{-1}, solved through a Cholesky factorisation
    Eigen::MatrixXd PH_t = P_ * H_.transpose();
    Eigen::MatrixXd K;
    Eigen::LLT<Eigen::MatrixXd> llt_S(S);
    if (llt_S.info() == Eigen::Success) {
        K = llt_S.solve(PH_t.transpose()).transpose();
    } else {
        K = Eigen::LDLT<Eigen::MatrixXd>(S).solve(PH_t.transpose()).transpose();
    }

    Eigen::VectorXd x_new = x_ + K * y;
    if (!x_new.allFinite()) {
        return make_error<Eigen::VectorXd>(ErrorCode::NUMERICAL_ERROR,
                                           "Kalman update produced a non-finite state",
                                           "KalmanFilter");
    }

    // Update state: x_k|k = x_k|k-1 + K * y
    x_ = x_new;

    // Update covariance: P_k|k = (I - K * H) * P_k|k-1
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(config_.state_dim, config_.state_dim);
    P_ = (I - K * H_) * P_;

    return Result<Eigen::VectorXd>(x_);
}

Result<Eigen::VectorXd> KalmanFilter::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return make_error<Eigen::VectorXd>(ErrorCode::NOT_INITIALIZED,
                                           "Kalman filter has not been initialized",
                                           "KalmanFilter");
    }

    return Result<Eigen::VectorXd>(x_);
}

}  // namespace statistics
}  // namespace signal_ngin
