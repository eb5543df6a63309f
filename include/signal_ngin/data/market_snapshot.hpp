// include/signal_ngin/data/market_snapshot.hpp
#pragma once

#include <memory>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Point-in-time state of the perpetual market
 *
 * Built once by a snapshot source and then shared read-only for the tick.
 */
struct MarketSnapshot {
    Timestamp timestamp;    // Exchange time of the book
    Timestamp received_at;  // Local receive time
    std::string coin;

    Price best_bid{0.0};
    Price best_ask{0.0};
    double bid_size{0.0};  // Size resting at the best bid
    double ask_size{0.0};  // Size resting at the best ask
    double bid_depth{0.0};  // Total size over the configured number of levels
    double ask_depth{0.0};

    // Trade flow inside the source's trade window
    double buy_volume{0.0};   // Buyer-initiated
    double sell_volume{0.0};  // Seller-initiated
    int trade_count{0};

    Price mid() const {
        return 0.5 * (best_bid + best_ask);
    }

    Price spread() const {
        return best_ask - best_bid;
    }

    /**
     * @brief Size-weighted mid; falls back to mid when the top of book is empty
     */
    Price microprice() const {
        double total = bid_size + ask_size;
        if (total <= 0.0) {
            return mid();
        }
        return (best_bid * ask_size + best_ask * bid_size) / total;
    }
};

using SnapshotPtr = std::shared_ptr<const MarketSnapshot>;

/**
 * @brief Reject books that cannot produce a meaningful mid price
 */
inline Result<void> validate_snapshot(const MarketSnapshot& snapshot) {
    if (!(snapshot.best_bid > 0.0) || !(snapshot.best_ask > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Empty or non-positive top of book",
                                "MarketSnapshot");
    }
    if (snapshot.best_bid >= snapshot.best_ask) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Crossed or locked book",
                                "MarketSnapshot");
    }
    if (snapshot.bid_size < 0.0 || snapshot.ask_size < 0.0 || snapshot.buy_volume < 0.0 ||
        snapshot.sell_volume < 0.0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Negative size or volume",
                                "MarketSnapshot");
    }
    return Result<void>();
}

}  // namespace signal_ngin
