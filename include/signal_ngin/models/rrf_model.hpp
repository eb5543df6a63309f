// include/signal_ngin/models/rrf_model.hpp
#pragma once

#include <map>
#include "signal_ngin/models/label_buffer.hpp"
#include "signal_ngin/models/model_base.hpp"

namespace signal_ngin {

/**
 * @brief RRF parameters
 */
struct RRFConfig : public ConfigBase {
    ModelInputConfig inputs;
    double forgetting_factor{0.995};
    double ridge_lambda{1.0};       // Prior precision; P starts at I / lambda
    double residual_halflife{100.0};
    int min_samples{30};
    int max_label_delay_ms{30000};

    nlohmann::json to_json() const override {
        nlohmann::json j = inputs.to_json();
        j["forgetting_factor"] = forgetting_factor;
        j["ridge_lambda"] = ridge_lambda;
        j["residual_halflife"] = residual_halflife;
        j["min_samples"] = min_samples;
        j["max_label_delay_ms"] = max_label_delay_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        inputs.from_json(j);
        if (j.contains("forgetting_factor"))
            forgetting_factor = j.at("forgetting_factor").get<double>();
        if (j.contains("ridge_lambda"))
            ridge_lambda = j.at("ridge_lambda").get<double>();
        if (j.contains("residual_halflife"))
            residual_halflife = j.at("residual_halflife").get<double>();
        if (j.contains("min_samples"))
            min_samples = j.at("min_samples").get<int>();
        if (j.contains("max_label_delay_ms"))
            max_label_delay_ms = j.at("max_label_delay_ms").get<int>();
    }
};

/**
 * @brief Recursive ridge forecaster
 *
 * Per horizon, recursive least squares with exponential forgetting predicts the horizon
 * log return. Residual variance is an EWMA of a-priori squared errors, and
 * P(up) = Phi(y_hat / s).
 */
class RRFModel : public ModelBase {
public:
    RRFModel(std::string id, std::vector<HorizonKey> horizons, RRFConfig config);

    std::string type() const override {
        return "RRF";
    }

    Result<ModelOutput> score(const FeatureVector& features) const override;
    Result<void> update(const FeatureVector& features) override;

    size_t samples(HorizonKey horizon) const;

    /**
     * @brief Current coefficients (inputs then intercept) for a horizon
     */
    Result<Eigen::VectorXd> coefficients(HorizonKey horizon) const;

private:
    struct HorizonState {
        Eigen::VectorXd theta;
        Eigen::MatrixXd P;
        double residual_var{0.0};
        size_t samples{0};
        LabelBuffer labels;
    };

    void reset(HorizonState& state) const;
    Result<void> train(HorizonState& state, const LabeledSample& sample);

    RRFConfig config_;
    double residual_decay_;
    std::map<HorizonKey, HorizonState> states_;
};

}  // namespace signal_ngin
