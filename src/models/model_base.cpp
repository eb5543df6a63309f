// src/models/model_base.cpp

#include "signal_ngin/models/model_base.hpp"
#include <algorithm>
#include <stdexcept>

namespace signal_ngin {

namespace {

statistics::StandardizerConfig standardizer_config(const ModelInputConfig& inputs) {
    statistics::StandardizerConfig config;
    config.halflife = inputs.standardizer_halflife;
    config.clip = inputs.standardizer_clip;
    config.warmup = inputs.standardizer_warmup;
    return config;
}

}  // namespace

ModelBase::ModelBase(std::string id, std::vector<HorizonKey> horizons,
                     const ModelInputConfig& inputs)
    : id_(std::move(id)),
      horizons_(std::move(horizons)),
      indices_(resolve_indices(inputs.features)),
      standardizer_(indices_.size(), standardizer_config(inputs)) {
    if (id_.empty()) {
        throw std::invalid_argument("Model id must not be empty");
    }
    if (horizons_.empty()) {
        throw std::invalid_argument("Model " + id_ + " has no horizons");
    }
    std::sort(horizons_.begin(), horizons_.end());
}

std::vector<size_t> ModelBase::resolve_indices(const std::vector<std::string>& names) {
    if (names.empty()) {
        throw std::invalid_argument("Model needs at least one input feature");
    }
    std::vector<size_t> indices;
    for (const auto& name : names) {
        size_t idx = feature_index(name);
        if (idx == FEATURE_COUNT) {
            throw std::invalid_argument("Unknown feature: " + name);
        }
        indices.push_back(idx);
    }
    return indices;
}

Eigen::VectorXd ModelBase::select(const FeatureVector& features) const {
    Eigen::VectorXd x(indices_.size());
    for (size_t i = 0; i < indices_.size(); ++i) {
        x(i) = features.values[indices_[i]];
    }
    return x;
}

Result<Eigen::VectorXd> ModelBase::design_row(const FeatureVector& features) const {
    auto z = standardizer_.transform(select(features));
    if (z.is_error()) {
        return z;
    }
    Eigen::VectorXd row(design_dim());
    row.head(input_dim()) = z.value();
    row(input_dim()) = 1.0;
    return row;
}

Result<void> ModelBase::observe(const FeatureVector& features) {
    return standardizer_.update(select(features));
}

}  // namespace signal_ngin
