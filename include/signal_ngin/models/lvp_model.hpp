// include/signal_ngin/models/lvp_model.hpp
#pragma once

#include "signal_ngin/models/model_base.hpp"
#include "signal_ngin/statistics/statistics_tools.hpp"

namespace signal_ngin {

/**
 * @brief LVP parameters
 */
struct LVPConfig : public ConfigBase {
    ModelInputConfig inputs;
    double drift_process_noise{1e-12};  // Per second, on the per-second drift
    double measurement_noise_floor{1e-12};
    double ofi_beta{0.15};              // Weight of tanh(z(ofi_w)) in the score
    int min_returns{10};
    int max_gap_ms{120000};             // Longer gaps between ticks are not used as returns
    statistics::GARCHConfig garch;

    nlohmann::json to_json() const override {
        nlohmann::json j = inputs.to_json();
        j["drift_process_noise"] = drift_process_noise;
        j["measurement_noise_floor"] = measurement_noise_floor;
        j["ofi_beta"] = ofi_beta;
        j["min_returns"] = min_returns;
        j["max_gap_ms"] = max_gap_ms;
        j["garch_alpha"] = garch.alpha;
        j["garch_beta"] = garch.beta;
        j["garch_min_observations"] = garch.min_observations;
        j["garch_refit_interval"] = garch.refit_interval;
        j["garch_max_window"] = garch.max_window;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        inputs.from_json(j);
        if (j.contains("drift_process_noise"))
            drift_process_noise = j.at("drift_process_noise").get<double>();
        if (j.contains("measurement_noise_floor"))
            measurement_noise_floor = j.at("measurement_noise_floor").get<double>();
        if (j.contains("ofi_beta"))
            ofi_beta = j.at("ofi_beta").get<double>();
        if (j.contains("min_returns"))
            min_returns = j.at("min_returns").get<int>();
        if (j.contains("max_gap_ms"))
            max_gap_ms = j.at("max_gap_ms").get<int>();
        if (j.contains("garch_alpha"))
            garch.alpha = j.at("garch_alpha").get<double>();
        if (j.contains("garch_beta"))
            garch.beta = j.at("garch_beta").get<double>();
        if (j.contains("garch_min_observations"))
            garch.min_observations = j.at("garch_min_observations").get<int>();
        if (j.contains("garch_refit_interval"))
            garch.refit_interval = j.at("garch_refit_interval").get<int>();
        if (j.contains("garch_max_window"))
            garch.max_window = j.at("garch_max_window").get<int>();
    }
};

/**
 * @brief Latent volatility process
 *
 * A scalar Kalman filter tracks the per-second drift of the log mid; GARCH(1,1) on
 * per-second normalised returns tracks variance. For horizon H:
 *   P(up) = Phi(mu * H / sigma_H + ofi_beta * tanh(z(ofi_w)))
 * with sigma_H^2 the GARCH variance accumulated over H seconds.
 */
class LVPModel : public ModelBase {
public:
    LVPModel(std::string id, std::vector<HorizonKey> horizons, LVPConfig config);

    std::string type() const override {
        return "LVP";
    }

    Result<ModelOutput> score(const FeatureVector& features) const override;
    Result<void> update(const FeatureVector& features) override;

    /**
     * @brief Current per-second drift estimate
     */
    double drift() const;

    size_t returns_seen() const {
        return garch_.observations();
    }

private:
    LVPConfig config_;
    statistics::KalmanFilter drift_filter_;
    statistics::GARCH garch_;
    int ofi_position_{-1};  // Position of ofi_w inside the selected inputs

    bool has_last_{false};
    Timestamp last_time_;
    Price last_mid_{0.0};
};

}  // namespace signal_ngin
