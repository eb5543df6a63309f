// include/signal_ngin/models/model_factory.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/models/model_component.hpp"

namespace signal_ngin {

/**
 * @brief One entry of the configured model set
 */
struct ModelSpec : public ConfigBase {
    std::string id;
    std::string type;  // HCQR, LVP or RRF
    double weight{1.0};
    nlohmann::json params = nlohmann::json::object();

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["id"] = id;
        j["type"] = type;
        j["weight"] = weight;
        j["params"] = params;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("id"))
            id = j.at("id").get<std::string>();
        if (j.contains("type"))
            type = j.at("type").get<std::string>();
        if (j.contains("weight"))
            weight = j.at("weight").get<double>();
        if (j.contains("params"))
            params = j.at("params");
    }
};

/**
 * @brief Builds model components from configuration
 */
class ModelFactory {
public:
    /**
     * @return The component, or INVALID_ARGUMENT for an unknown type or bad parameters
     */
    static Result<std::unique_ptr<ModelComponent>> create(const ModelSpec& spec,
                                                          const std::vector<HorizonKey>& horizons);

    static std::vector<std::string> known_types();
};

}  // namespace signal_ngin
