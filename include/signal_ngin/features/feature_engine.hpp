// include/signal_ngin/features/feature_engine.hpp
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/data/market_snapshot.hpp"
#include "signal_ngin/features/feature_vector.hpp"
#include "signal_ngin/features/history_window.hpp"

namespace signal_ngin {

/**
 * @brief Feature engine settings
 */
struct FeatureConfig : public ConfigBase {
    int history_window_ms{120000};  // Must cover the longest lookback return
    int history_max_count{2048};
    int min_history{1};  // Ticks with fewer history snapshots are skipped
    int ofi_window_ms{30000};
    int vol_window_ms{60000};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["history_window_ms"] = history_window_ms;
        j["history_max_count"] = history_max_count;
        j["min_history"] = min_history;
        j["ofi_window_ms"] = ofi_window_ms;
        j["vol_window_ms"] = vol_window_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("history_window_ms"))
            history_window_ms = j.at("history_window_ms").get<int>();
        if (j.contains("history_max_count"))
            history_max_count = j.at("history_max_count").get<int>();
        if (j.contains("min_history"))
            min_history = j.at("min_history").get<int>();
        if (j.contains("ofi_window_ms"))
            ofi_window_ms = j.at("ofi_window_ms").get<int>();
        if (j.contains("vol_window_ms"))
            vol_window_ms = j.at("vol_window_ms").get<int>();
    }
};

/**
 * @brief Derives the fixed-shape feature vector from a snapshot and its history
 *
 * compute() is a pure function of its arguments.
 *
 * Missing-input policy, applied to every feature alike:
 *  - fewer than min_history snapshots in the window: INSUFFICIENT_HISTORY, the tick is skipped
 *  - otherwise any input that cannot be computed takes the neutral value 0.0
 */
class FeatureEngine {
public:
    explicit FeatureEngine(FeatureConfig config);

    /**
     * @brief Compute features for a snapshot
     * @param snapshot Current snapshot, not yet in history
     * @param history Snapshots from earlier ticks
     */
    Result<FeatureVector> compute(const MarketSnapshot& snapshot,
                                  const HistoryWindow& history) const;

    /**
     * @brief A history window sized for this engine
     */
    HistoryWindow make_history() const;

    const FeatureConfig& config() const {
        return config_;
    }

    /**
     * @brief Top-of-book order flow imbalance between two consecutive books
     */
    static double order_flow_increment(const MarketSnapshot& prev, const MarketSnapshot& cur);

private:
    double lookback_return(const MarketSnapshot& snapshot, const HistoryWindow& history,
                           std::chrono::seconds lookback) const;
    double order_flow_imbalance(const MarketSnapshot& snapshot,
                                const HistoryWindow& history) const;
    double realized_volatility(const MarketSnapshot& snapshot,
                               const HistoryWindow& history) const;

    FeatureConfig config_;
};

}  // namespace signal_ngin
