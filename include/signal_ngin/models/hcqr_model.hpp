// include/signal_ngin/models/hcqr_model.hpp
#pragma once

#include <array>
#include <map>
#include "signal_ngin/models/label_buffer.hpp"
#include "signal_ngin/models/model_base.hpp"

namespace signal_ngin {

/**
 * @brief HCQR parameters
 */
struct HCQRConfig : public ConfigBase {
    ModelInputConfig inputs;
    double learning_rate{0.01};
    int min_samples{30};          // Labelled samples per horizon before scoring
    double scale_halflife{200.0};  // EWMA halflife of squared horizon returns
    double probability_floor{0.05};
    int max_label_delay_ms{30000};

    nlohmann::json to_json() const override {
        nlohmann::json j = inputs.to_json();
        j["learning_rate"] = learning_rate;
        j["min_samples"] = min_samples;
        j["scale_halflife"] = scale_halflife;
        j["probability_floor"] = probability_floor;
        j["max_label_delay_ms"] = max_label_delay_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        inputs.from_json(j);
        if (j.contains("learning_rate"))
            learning_rate = j.at("learning_rate").get<double>();
        if (j.contains("min_samples"))
            min_samples = j.at("min_samples").get<int>();
        if (j.contains("scale_halflife"))
            scale_halflife = j.at("scale_halflife").get<double>();
        if (j.contains("probability_floor"))
            probability_floor = j.at("probability_floor").get<double>();
        if (j.contains("max_label_delay_ms"))
            max_label_delay_ms = j.at("max_label_delay_ms").get<int>();
    }
};

/**
 * @brief Horizon-conditional quantile regression
 *
 * For every horizon, five linear quantile regressions are fitted online by SGD on the
 * pinball loss. Targets are the horizon log return divided by an EWMA estimate of its
 * scale. The up probability is 1 - F(0) where F interpolates linearly between the
 * sorted predicted quantiles.
 */
class HCQRModel : public ModelBase {
public:
    static constexpr std::array<double, 5> QUANTILES{{0.10, 0.25, 0.50, 0.75, 0.90}};

    HCQRModel(std::string id, std::vector<HorizonKey> horizons, HCQRConfig config);

    std::string type() const override {
        return "HCQR";
    }

    Result<ModelOutput> score(const FeatureVector& features) const override;
    Result<void> update(const FeatureVector& features) override;

    /**
     * @brief 1 - F(0) for sorted quantile predictions, clamped to [floor, 1 - floor]
     */
    static double prob_up_from_quantiles(std::array<double, 5> q, double floor);

    size_t samples(HorizonKey horizon) const;

private:
    struct HorizonState {
        Eigen::MatrixXd weights;  // One row per quantile level
        double scale_sq{0.0};     // EWMA of squared returns
        size_t samples{0};
        LabelBuffer labels;
    };

    void train(HorizonState& state, const LabeledSample& sample);

    HCQRConfig config_;
    double scale_decay_;
    std::map<HorizonKey, HorizonState> states_;
};

}  // namespace signal_ngin
