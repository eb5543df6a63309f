// include/signal_ngin/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/data/hyperliquid_snapshot_source.hpp"
#include "signal_ngin/ensemble/ensemble_combiner.hpp"
#include "signal_ngin/features/feature_engine.hpp"
#include "signal_ngin/live/tick_scheduler.hpp"
#include "signal_ngin/models/model_factory.hpp"
#include "signal_ngin/resolution/outcome_resolver.hpp"
#include "signal_ngin/storage/recorder.hpp"

namespace signal_ngin {

/**
 * @brief Complete runtime configuration of one signal process
 */
struct AppConfig : public ConfigBase {
    HyperliquidConfig market;
    SchedulerConfig scheduler;
    std::vector<HorizonKey> horizons_s{10, 30, 60};
    HorizonKey primary_horizon_s{30};
    FeatureConfig features;
    std::vector<ModelSpec> models;  // Ordered; the order is the record column order
    EnsembleConfig ensemble;
    ResolutionConfig resolution;
    RecorderConfig recorder;
    LoggerConfig logging;

    std::vector<std::string> model_ids() const {
        std::vector<std::string> ids;
        ids.reserve(models.size());
        for (const auto& spec : models) {
            ids.push_back(spec.id);
        }
        return ids;
    }

    nlohmann::json to_json() const override;

    /**
     * @brief Read every section present in j; model weights are copied into the ensemble
     * @throws nlohmann::json::exception or std::invalid_argument on malformed sections
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Loads defaults.json and deep-merges a variant file over it
 *
 * Layout:
 *   <config_dir>/defaults.json
 *   <config_dir>/variants/<variant>.json
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration for a named variant
     * @param config_dir Base path to the config directory (e.g. "./config")
     * @param variant Variant name; empty loads defaults.json alone
     * @return Result containing AppConfig or error
     */
    static Result<AppConfig> load(const std::filesystem::path& config_dir,
                                  const std::string& variant);

    /**
     * @brief Build an AppConfig from an already merged document
     */
    static Result<AppConfig> from_json(const nlohmann::json& merged);

    static Result<void> validate_config(const AppConfig& config);

    /**
     * @brief Recursively merge JSON objects
     *
     * For nested objects, performs deep merge. For other types, including arrays such as
     * the model list, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
    static void log_config_summary(const AppConfig& config);
};

}  // namespace signal_ngin
