// src/core/config_loader.cpp

#include "signal_ngin/core/config_loader.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace signal_ngin {

namespace {

bool is_valid_model_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    // Ids become column names, so keep them to identifier characters
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_';
    });
}

}  // namespace

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["market"] = market.to_json();
    j["scheduler"] = scheduler.to_json();
    j["horizons_s"] = horizons_s;
    j["primary_horizon_s"] = primary_horizon_s;
    j["features"] = features.to_json();
    nlohmann::json model_list = nlohmann::json::array();
    for (const auto& spec : models) {
        model_list.push_back(spec.to_json());
    }
    j["models"] = model_list;
    j["ensemble"] = ensemble.to_json();
    j["resolution"] = resolution.to_json();
    j["recorder"] = recorder.to_json();
    j["logging"] = logging.to_json();
    return j;
}

void AppConfig::from_json(const nlohmann::json& j) {
    if (j.contains("market"))
        market.from_json(j.at("market"));
    if (j.contains("scheduler"))
        scheduler.from_json(j.at("scheduler"));
    if (j.contains("horizons_s"))
        horizons_s = j.at("horizons_s").get<std::vector<HorizonKey>>();
    if (j.contains("primary_horizon_s"))
        primary_horizon_s = j.at("primary_horizon_s").get<HorizonKey>();
    if (j.contains("features"))
        features.from_json(j.at("features"));
    if (j.contains("models")) {
        models.clear();
        for (const auto& entry : j.at("models")) {
            ModelSpec spec;
            spec.from_json(entry);
            models.push_back(std::move(spec));
        }
    }
    if (j.contains("ensemble"))
        ensemble.from_json(j.at("ensemble"));
    if (j.contains("resolution"))
        resolution.from_json(j.at("resolution"));
    if (j.contains("recorder"))
        recorder.from_json(j.at("recorder"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));

    // Model weights live with the model entries
    ensemble.weights.clear();
    for (const auto& spec : models) {
        ensemble.weights[spec.id] = spec.weight;
    }
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::from_json(const nlohmann::json& merged) {
    try {
        AppConfig config;
        config.from_json(merged);
        return config;
    } catch (const std::exception& e) {
        return make_error<AppConfig>(ErrorCode::INVALID_DATA,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_DATA, message, "ConfigLoader");
    };

    if (config.scheduler.cadence_ms <= 0) {
        return invalid("scheduler.cadence_ms must be positive");
    }
    if (config.scheduler.fetch_timeout_ms <= 0 || config.scheduler.model_timeout_ms <= 0) {
        return invalid("scheduler timeouts must be positive");
    }
    if (config.scheduler.model_timeout_ms >= config.scheduler.cadence_ms) {
        return invalid("scheduler.model_timeout_ms must be shorter than the cadence");
    }
    if (config.scheduler.write_retry_backoff_ms <= 0 ||
        config.scheduler.write_retry_max_attempts <= 0) {
        return invalid("scheduler write retry settings must be positive");
    }

    if (config.horizons_s.empty()) {
        return invalid("horizons_s must not be empty");
    }
    std::set<HorizonKey> seen_horizons;
    for (HorizonKey h : config.horizons_s) {
        if (h <= 0) {
            return invalid("horizons_s entries must be positive, got " + std::to_string(h));
        }
        if (!seen_horizons.insert(h).second) {
            return invalid("Duplicate horizon " + std::to_string(h) + "s");
        }
    }
    if (seen_horizons.count(config.primary_horizon_s) == 0) {
        return invalid("primary_horizon_s " + std::to_string(config.primary_horizon_s) +
                       " is not one of horizons_s");
    }

    if (config.models.empty()) {
        return invalid("At least one model is required");
    }
    std::set<std::string> seen_ids;
    double weight_sum = 0.0;
    for (const auto& spec : config.models) {
        if (!is_valid_model_id(spec.id)) {
            return invalid("Model id '" + spec.id + "' must be non-empty [A-Za-z0-9_]");
        }
        if (spec.id == "fused" || spec.id == "fused_cal") {
            return invalid("Model id '" + spec.id + "' collides with an ensemble column");
        }
        if (!seen_ids.insert(spec.id).second) {
            return invalid("Duplicate model id '" + spec.id + "'");
        }
        if (!(spec.weight >= 0.0)) {
            return invalid("Model '" + spec.id + "' has a negative weight");
        }
        weight_sum += spec.weight;
    }
    if (weight_sum <= 0.0) {
        return invalid("Model weights must have a positive sum");
    }

    if (config.ensemble.calibration_temperature <= 0.0) {
        return invalid("ensemble.calibration_temperature must be positive");
    }
    if (config.ensemble.probability_floor < 0.0 || config.ensemble.probability_floor >= 0.5) {
        return invalid("ensemble.probability_floor must be in [0, 0.5)");
    }
    if (config.resolution.grace_ms < 0) {
        return invalid("resolution.grace_ms must not be negative");
    }
    if (config.features.min_history < 0) {
        return invalid("features.min_history must not be negative");
    }
    if (config.features.history_window_ms <= 0 || config.features.history_max_count <= 0) {
        return invalid("features history bounds must be positive");
    }
    if (config.market.coin.empty()) {
        return invalid("market.coin must not be empty");
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }

    std::ostringstream horizons;
    for (size_t i = 0; i < config.horizons_s.size(); ++i) {
        horizons << (i ? "," : "") << config.horizons_s[i] << "s";
    }
    std::ostringstream models;
    for (size_t i = 0; i < config.models.size(); ++i) {
        const auto& spec = config.models[i];
        models << (i ? ", " : "") << spec.id << "(" << spec.type << " w=" << spec.weight << ")";
    }

    INFO("Config summary: coin=" << config.market.coin << ", cadence=" << config.scheduler.cadence_ms
                                 << "ms, horizons=" << horizons.str()
                                 << ", primary=" << config.primary_horizon_s << "s");
    INFO("Config summary: models=" << models.str() << ", rule="
                                   << combination_rule_to_string(config.ensemble.rule)
                                   << ", grace=" << config.resolution.grace_ms << "ms");
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_dir,
                                     const std::string& variant) {
    // 1. Load defaults.json
    auto defaults_result = load_json_file(config_dir / "defaults.json");
    if (defaults_result.is_error()) {
        return make_error<AppConfig>(defaults_result.error()->code(),
                                     "Failed to load defaults.json: " +
                                         std::string(defaults_result.error()->what()),
                                     "ConfigLoader");
    }
    nlohmann::json merged = defaults_result.value();

    // 2. Overlay the variant
    if (!variant.empty()) {
        auto variant_path = config_dir / "variants" / (variant + ".json");
        auto variant_result = load_json_file(variant_path);
        if (variant_result.is_error()) {
            return make_error<AppConfig>(variant_result.error()->code(),
                                         "Failed to load variant '" + variant + "': " +
                                             std::string(variant_result.error()->what()),
                                         "ConfigLoader");
        }
        merge_json(merged, variant_result.value());
    }

    // 3. Extract and validate
    auto config_result = from_json(merged);
    if (config_result.is_error()) {
        return config_result;
    }

    auto validation_result = validate_config(config_result.value());
    if (validation_result.is_error()) {
        return make_error<AppConfig>(validation_result.error()->code(),
                                     validation_result.error()->what(), "ConfigLoader");
    }

    log_config_summary(config_result.value());
    return config_result;
}

}  // namespace signal_ngin
