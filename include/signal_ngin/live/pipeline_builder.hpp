// include/signal_ngin/live/pipeline_builder.hpp
#pragma once

#include <memory>
#include "signal_ngin/core/config_loader.hpp"
#include "signal_ngin/live/tick_scheduler.hpp"

namespace signal_ngin {

/**
 * @brief Assemble the scheduler pipeline described by a validated configuration
 *
 * Models are created in configuration order, each behind its own runner.
 *
 * @param source Snapshot source the scheduler will pull from
 * @param recorder Recorder whose schema matches the configured models and horizons
 * @return INVALID_ARGUMENT if a model cannot be built
 */
Result<Pipeline> build_pipeline(const AppConfig& config,
                                std::shared_ptr<MarketSnapshotSource> source,
                                std::unique_ptr<Recorder> recorder);

/**
 * @brief Record layout for a configuration: model columns in configuration order
 */
RecordSchema make_record_schema(const AppConfig& config);

}  // namespace signal_ngin
