// include/signal_ngin/features/feature_vector.hpp
#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Fixed feature schema. The enum value is the position in every FeatureVector
 * and the column order in the persisted record.
 */
enum class Feature : size_t {
    MID = 0,
    SPREAD,
    SPREAD_BPS,
    BOOK_IMBALANCE,
    MICROPRICE_OFFSET_BPS,
    OFI_W,
    TRADE_IMBALANCE,
    TRADE_VOLUME,
    RET_10S,
    RET_30S,
    RET_60S,
    REALIZED_VOL,
    COUNT
};

constexpr size_t FEATURE_COUNT = static_cast<size_t>(Feature::COUNT);

inline const std::array<std::string, FEATURE_COUNT>& feature_names() {
    static const std::array<std::string, FEATURE_COUNT> names = {
        "mid",     "spread",      "spread_bps", "book_imbalance", "microprice_offset_bps",
        "ofi_w",   "trade_imbalance", "trade_volume", "ret_10s", "ret_30s",
        "ret_60s", "realized_vol"};
    return names;
}

/**
 * @brief Position of a named feature, or FEATURE_COUNT when the name is unknown
 */
inline size_t feature_index(const std::string& name) {
    const auto& names = feature_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name)
            return i;
    }
    return FEATURE_COUNT;
}

/**
 * @brief Feature values for one tick, always FEATURE_COUNT wide
 */
struct FeatureVector {
    Timestamp timestamp;  // Snapshot time the features describe
    Price mid{0.0};
    std::array<double, FEATURE_COUNT> values{};

    double operator[](Feature f) const {
        return values[static_cast<size_t>(f)];
    }

    double& operator[](Feature f) {
        return values[static_cast<size_t>(f)];
    }

    static constexpr size_t size() {
        return FEATURE_COUNT;
    }
};

using FeatureVectorPtr = std::shared_ptr<const FeatureVector>;

}  // namespace signal_ngin
