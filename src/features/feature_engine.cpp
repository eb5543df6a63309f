// src/features/feature_engine.cpp

#include "signal_ngin/features/feature_engine.hpp"
#include <cmath>
#include <vector>

namespace signal_ngin {

namespace {

double neutral_if_invalid(double value) {
    return std::isfinite(value) ? value : 0.0;
}

}  // namespace

FeatureEngine::FeatureEngine(FeatureConfig config) : config_(std::move(config)) {
    if (config_.min_history < 0) {
        throw std::invalid_argument("min_history must not be negative");
    }
    if (config_.history_window_ms <= 0 || config_.history_max_count <= 0 ||
        config_.ofi_window_ms <= 0 || config_.vol_window_ms <= 0) {
        throw std::invalid_argument("Feature windows must be positive");
    }
}

HistoryWindow FeatureEngine::make_history() const {
    return HistoryWindow(std::chrono::milliseconds(config_.history_window_ms),
                         static_cast<size_t>(config_.history_max_count));
}

Result<FeatureVector> FeatureEngine::compute(const MarketSnapshot& snapshot,
                                             const HistoryWindow& history) const {
    auto valid = validate_snapshot(snapshot);
    if (valid.is_error()) {
        return forward_error<FeatureVector>(valid, "FeatureEngine");
    }

    if (history.size() < static_cast<size_t>(config_.min_history)) {
        return make_error<FeatureVector>(
            ErrorCode::INSUFFICIENT_HISTORY,
            "History holds " + std::to_string(history.size()) + " of " +
                std::to_string(config_.min_history) + " required snapshots",
            "FeatureEngine");
    }

    if (!history.empty() && history.newest()->timestamp >= snapshot.timestamp) {
        return make_error<FeatureVector>(ErrorCode::INVALID_DATA,
                                         "Snapshot is not newer than history",
                                         "FeatureEngine");
    }

    FeatureVector fv;
    fv.timestamp = snapshot.timestamp;
    fv.mid = snapshot.mid();

    const double mid = snapshot.mid();
    fv[Feature::MID] = mid;
    fv[Feature::SPREAD] = snapshot.spread();
    fv[Feature::SPREAD_BPS] = snapshot.spread() / mid * 1e4;

    double depth = snapshot.bid_depth + snapshot.ask_depth;
    fv[Feature::BOOK_IMBALANCE] =
        depth > 0.0 ? (snapshot.bid_depth - snapshot.ask_depth) / depth : 0.0;
    fv[Feature::MICROPRICE_OFFSET_BPS] = (snapshot.microprice() - mid) / mid * 1e4;

    fv[Feature::OFI_W] = order_flow_imbalance(snapshot, history);

    double volume = snapshot.buy_volume + snapshot.sell_volume;
    fv[Feature::TRADE_IMBALANCE] =
        volume > 0.0 ? (snapshot.buy_volume - snapshot.sell_volume) / volume : 0.0;
    fv[Feature::TRADE_VOLUME] = volume;

    fv[Feature::RET_10S] = lookback_return(snapshot, history, std::chrono::seconds(10));
    fv[Feature::RET_30S] = lookback_return(snapshot, history, std::chrono::seconds(30));
    fv[Feature::RET_60S] = lookback_return(snapshot, history, std::chrono::seconds(60));
    fv[Feature::REALIZED_VOL] = realized_volatility(snapshot, history);

    for (double& v : fv.values) {
        v = neutral_if_invalid(v);
    }
    return fv;
}

double FeatureEngine::lookback_return(const MarketSnapshot& snapshot, const HistoryWindow& history,
                                      std::chrono::seconds lookback) const {
    SnapshotPtr ref = history.latest_at_or_before(snapshot.timestamp - lookback);
    if (!ref) {
        return 0.0;
    }
    return std::log(snapshot.mid() / ref->mid());
}

double FeatureEngine::order_flow_increment(const MarketSnapshot& prev,
                                           const MarketSnapshot& cur) {
    double e = 0.0;
    if (cur.best_bid >= prev.best_bid)
        e += cur.bid_size;
    if (cur.best_bid <= prev.best_bid)
        e -= prev.bid_size;
    if (cur.best_ask <= prev.best_ask)
        e -= cur.ask_size;
    if (cur.best_ask >= prev.best_ask)
        e += prev.ask_size;
    return e;
}

double FeatureEngine::order_flow_imbalance(const MarketSnapshot& snapshot,
                                           const HistoryWindow& history) const {
    const auto& entries = history.entries();
    if (entries.empty()) {
        return 0.0;
    }

    Timestamp window_start = snapshot.timestamp - std::chrono::milliseconds(config_.ofi_window_ms);
    double ofi = 0.0;

    // Pairs (prev, cur) whose later book falls inside the window
    for (size_t i = 1; i < entries.size(); ++i) {
        if (entries[i]->timestamp > window_start) {
            ofi += order_flow_increment(*entries[i - 1], *entries[i]);
        }
    }
    ofi += order_flow_increment(*entries.back(), snapshot);
    return ofi;
}

double FeatureEngine::realized_volatility(const MarketSnapshot& snapshot,
                                          const HistoryWindow& history) const {
    Timestamp window_start = snapshot.timestamp - std::chrono::milliseconds(config_.vol_window_ms);

    std::vector<double> mids;
    for (const auto& s : history.entries()) {
        if (s->timestamp >= window_start) {
            mids.push_back(s->mid());
        }
    }
    mids.push_back(snapshot.mid());

    if (mids.size() < 3) {
        return 0.0;
    }

    double sum_sq = 0.0;
    for (size_t i = 1; i < mids.size(); ++i) {
        double r = std::log(mids[i] / mids[i - 1]);
        sum_sq += r * r;
    }
    return std::sqrt(sum_sq);
}

}  // namespace signal_ngin
