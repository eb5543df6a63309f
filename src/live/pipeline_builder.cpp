// src/live/pipeline_builder.cpp

#include "signal_ngin/live/pipeline_builder.hpp"
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

RecordSchema make_record_schema(const AppConfig& config) {
    return RecordSchema(config.model_ids(), config.horizons_s, config.primary_horizon_s);
}

Result<Pipeline> build_pipeline(const AppConfig& config,
                                std::shared_ptr<MarketSnapshotSource> source,
                                std::unique_ptr<Recorder> recorder) {
    if (!source || !recorder) {
        return make_error<Pipeline>(ErrorCode::INVALID_ARGUMENT,
                                    "Pipeline needs a snapshot source and a recorder",
                                    "PipelineBuilder");
    }

    Pipeline pipeline;
    pipeline.source = std::move(source);
    pipeline.recorder = std::move(recorder);

    try {
        pipeline.features = std::make_unique<FeatureEngine>(config.features);
        pipeline.ensemble = std::make_unique<EnsembleCombiner>(config.ensemble);
        pipeline.resolver = std::make_unique<OutcomeResolver>(config.resolution);
    } catch (const std::invalid_argument& e) {
        return make_error<Pipeline>(ErrorCode::INVALID_ARGUMENT, e.what(), "PipelineBuilder");
    }

    for (const auto& spec : config.models) {
        auto model = ModelFactory::create(spec, config.horizons_s);
        if (model.is_error()) {
            return forward_error<Pipeline>(model, "PipelineBuilder");
        }
        INFO("Model " << spec.id << " (" << spec.type << ") ready, weight " << spec.weight);
        pipeline.runners.push_back(std::make_unique<ModelRunner>(model.take()));
    }

    return Result<Pipeline>(std::move(pipeline));
}

}  // namespace signal_ngin
