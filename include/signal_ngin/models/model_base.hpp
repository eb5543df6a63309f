// include/signal_ngin/models/model_base.hpp
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/models/model_component.hpp"
#include "signal_ngin/statistics/statistics_tools.hpp"

namespace signal_ngin {

/**
 * @brief Parameters shared by every model component
 */
struct ModelInputConfig : public ConfigBase {
    // Features fed to the model. Absolute price levels are left out by default.
    std::vector<std::string> features{"spread_bps", "book_imbalance", "microprice_offset_bps",
                                      "ofi_w",      "trade_imbalance", "trade_volume",
                                      "ret_10s",    "ret_30s",         "ret_60s",
                                      "realized_vol"};
    double standardizer_halflife{200.0};
    double standardizer_clip{5.0};
    int standardizer_warmup{5};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["features"] = features;
        j["standardizer_halflife"] = standardizer_halflife;
        j["standardizer_clip"] = standardizer_clip;
        j["standardizer_warmup"] = standardizer_warmup;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("features"))
            features = j.at("features").get<std::vector<std::string>>();
        if (j.contains("standardizer_halflife"))
            standardizer_halflife = j.at("standardizer_halflife").get<double>();
        if (j.contains("standardizer_clip"))
            standardizer_clip = j.at("standardizer_clip").get<double>();
        if (j.contains("standardizer_warmup"))
            standardizer_warmup = j.at("standardizer_warmup").get<int>();
    }
};

/**
 * @brief Common plumbing for model components: identity, horizons, feature selection
 * and standardisation
 */
class ModelBase : public ModelComponent {
public:
    /**
     * @throws std::invalid_argument on an empty id, no horizons or an unknown feature name
     */
    ModelBase(std::string id, std::vector<HorizonKey> horizons, const ModelInputConfig& inputs);

    const std::string& id() const override {
        return id_;
    }

    const std::vector<HorizonKey>& horizons() const override {
        return horizons_;
    }

protected:
    /**
     * @brief Selected raw features as a column vector
     */
    Eigen::VectorXd select(const FeatureVector& features) const;

    /**
     * @brief Standardised selected features with a trailing intercept term
     */
    Result<Eigen::VectorXd> design_row(const FeatureVector& features) const;

    /**
     * @brief Fold the features into the standardiser
     */
    Result<void> observe(const FeatureVector& features);

    size_t input_dim() const {
        return indices_.size();
    }

    /**
     * @brief Width of design_row(): inputs plus intercept
     */
    size_t design_dim() const {
        return indices_.size() + 1;
    }

    const std::vector<size_t>& feature_indices() const {
        return indices_;
    }

    const statistics::FeatureStandardizer& standardizer() const {
        return standardizer_;
    }

private:
    static std::vector<size_t> resolve_indices(const std::vector<std::string>& names);

    std::string id_;
    std::vector<HorizonKey> horizons_;
    std::vector<size_t> indices_;
    statistics::FeatureStandardizer standardizer_;
};

}  // namespace signal_ngin
