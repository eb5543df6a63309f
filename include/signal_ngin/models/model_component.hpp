// include/signal_ngin/models/model_component.hpp
#pragma once

#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/features/feature_vector.hpp"

namespace signal_ngin {

/**
 * @brief Interface for a directional model component
 *
 * score() must not modify state, so that scores within a tick do not depend on the order
 * in which components run. update() is called once per tick, after score(), with the
 * same features.
 */
class ModelComponent {
public:
    virtual ~ModelComponent() = default;

    virtual const std::string& id() const = 0;

    virtual std::string type() const = 0;

    virtual const std::vector<HorizonKey>& horizons() const = 0;

    /**
     * @brief Probability of an up move per horizon
     * @return Output with an entry for every horizon, available or not; an error result
     * means no horizon could be scored
     */
    virtual Result<ModelOutput> score(const FeatureVector& features) const = 0;

    /**
     * @brief Fold this tick's features into the component's rolling state
     */
    virtual Result<void> update(const FeatureVector& features) = 0;
};

}  // namespace signal_ngin
