// src/models/model_factory.cpp

#include "signal_ngin/models/model_factory.hpp"
#include <algorithm>
#include <cctype>
#include "signal_ngin/models/hcqr_model.hpp"
#include "signal_ngin/models/lvp_model.hpp"
#include "signal_ngin/models/rrf_model.hpp"

namespace signal_ngin {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

template <typename Model, typename Config>
std::unique_ptr<ModelComponent> build(const ModelSpec& spec,
                                      const std::vector<HorizonKey>& horizons) {
    Config config;
    config.from_json(spec.params);
    return std::make_unique<Model>(spec.id, horizons, std::move(config));
}

}  // namespace

std::vector<std::string> ModelFactory::known_types() {
    return {"HCQR", "LVP", "RRF"};
}

Result<std::unique_ptr<ModelComponent>> ModelFactory::create(
    const ModelSpec& spec, const std::vector<HorizonKey>& horizons) {
    std::string type = to_upper(spec.type);

    try {
        if (type == "HCQR") {
            return build<HCQRModel, HCQRConfig>(spec, horizons);
        }
        if (type == "LVP") {
            return build<LVPModel, LVPConfig>(spec, horizons);
        }
        if (type == "RRF") {
            return build<RRFModel, RRFConfig>(spec, horizons);
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::unique_ptr<ModelComponent>>(
            ErrorCode::INVALID_ARGUMENT,
            "Bad parameters for model " + spec.id + ": " + e.what(), "ModelFactory");
    } catch (const std::invalid_argument& e) {
        return make_error<std::unique_ptr<ModelComponent>>(ErrorCode::INVALID_ARGUMENT, e.what(),
                                                           "ModelFactory");
    }

    return make_error<std::unique_ptr<ModelComponent>>(
        ErrorCode::INVALID_ARGUMENT, "Unknown model type '" + spec.type + "' for " + spec.id,
        "ModelFactory");
}

}  // namespace signal_ngin
