// include/signal_ngin/statistics/statistics_tools.hpp
#pragma once

#include <Eigen/Dense>
#include <deque>
#include <mutex>
#include <vector>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {
namespace statistics {

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * @brief Configuration for the EWMA feature standardizer
 */
struct StandardizerConfig {
    double halflife{100.0};    // In observations
    double clip{5.0};          // Absolute z-score cap
    double min_variance{1e-12};
    int warmup{5};             // Observations before transform() returns non-zero scores
};

/**
 * @brief Configuration for the online GARCH(1,1) model
 */
struct GARCHConfig {
    double alpha{0.1};       // ARCH coefficient (initial)
    double beta{0.85};       // GARCH coefficient (initial)
    int min_observations{50};  // Sample variance is used until this many returns are seen
    int refit_interval{500};   // Re-estimate parameters every N returns after the first fit
    int max_window{2000};      // Returns retained for estimation
};

/**
 * @brief Configuration for Kalman Filter
 */
struct KalmanFilterConfig {
    int state_dim{1};
    int obs_dim{1};
    double process_noise{1e-10};
    double measurement_noise{1e-6};
    double initial_covariance{1e-6};
};

// ============================================================================
// Data Transformers
// ============================================================================

/**
 * @brief Exponentially weighted z-score transform
 *
 * transform() never mutates state; update() folds one observation into the running
 * mean and variance.
 */
class FeatureStandardizer {
public:
    FeatureStandardizer(size_t dim, StandardizerConfig config);

    Result<Eigen::VectorXd> transform(const Eigen::VectorXd& x) const;
    Result<void> update(const Eigen::VectorXd& x);

    size_t dim() const {
        return dim_;
    }

    long count() const {
        return count_;
    }

    bool is_warm() const {
        return count_ >= config_.warmup;
    }

    const Eigen::VectorXd& mean() const {
        return mean_;
    }

    const Eigen::VectorXd& variance() const {
        return var_;
    }

private:
    size_t dim_;
    StandardizerConfig config_;
    double decay_;
    Eigen::VectorXd mean_;
    Eigen::VectorXd var_;
    long count_{0};
};

// ============================================================================
// Volatility Models
// ============================================================================

/**
 * @brief GARCH(1,1) conditional variance fed one return at a time
 *
 * Until min_observations returns are seen the sample variance stands in for the
 * conditional variance. Parameters are fitted by grid search over the log-likelihood.
 */
class GARCH {
public:
    explicit GARCH(GARCHConfig config);

    Result<void> update(double new_return);

    /**
     * @brief Variance expected for the next return
     */
    Result<double> get_variance() const;

    /**
     * @brief Sum of expected variances over the next n returns
     */
    Result<double> forecast_cumulative(int n_periods) const;

    bool is_fitted() const {
        return fitted_;
    }

    size_t observations() const {
        return observed_;
    }

    double get_omega() const {
        return omega_;
    }
    double get_alpha() const {
        return alpha_;
    }
    double get_beta() const {
        return beta_;
    }

private:
    void estimate_parameters();
    double log_likelihood(double omega, double alpha, double beta) const;
    double sample_variance() const;

    GARCHConfig config_;
    double omega_{0.0};
    double alpha_;
    double beta_;
    std::deque<double> returns_;
    double conditional_variance_{0.0};
    size_t observed_{0};
    size_t since_fit_{0};
    bool fitted_{false};
};

// ============================================================================
// State Estimators
// ============================================================================

/**
 * @brief Linear Kalman filter
 */
class KalmanFilter {
public:
    explicit KalmanFilter(KalmanFilterConfig config);

    Result<void> initialize(const Eigen::VectorXd& initial_state);
    Result<Eigen::VectorXd> predict();
    Result<Eigen::VectorXd> update(const Eigen::VectorXd& observation);
    Result<Eigen::VectorXd> get_state() const;

    bool is_initialized() const {
        return initialized_;
    }

    void set_transition_matrix(const Eigen::MatrixXd& F) {
        F_ = F;
    }
    void set_observation_matrix(const Eigen::MatrixXd& H) {
        H_ = H;
    }
    void set_process_noise(const Eigen::MatrixXd& Q) {
        Q_ = Q;
    }
    void set_measurement_noise(const Eigen::MatrixXd& R) {
        R_ = R;
    }

    const Eigen::MatrixXd& get_state_covariance() const {
        return P_;
    }

private:
    KalmanFilterConfig config_;

    Eigen::VectorXd x_;  // State estimate
    Eigen::MatrixXd P_;  // State covariance

    Eigen::MatrixXd F_;  // State transition matrix
    Eigen::MatrixXd H_;  // Observation matrix
    Eigen::MatrixXd Q_;  // Process noise covariance
    Eigen::MatrixXd R_;  // Measurement noise covariance

    bool initialized_{false};
    mutable std::mutex mutex_;
};

}  // namespace statistics
}  // namespace signal_ngin
