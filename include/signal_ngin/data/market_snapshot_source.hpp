// include/signal_ngin/data/market_snapshot_source.hpp
#pragma once

#include <chrono>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/data/market_snapshot.hpp"

namespace signal_ngin {

/**
 * @brief Boundary to the live market feed
 *
 * Implementations return a fresh snapshot, or DATA_UNAVAILABLE when the feed is stale,
 * unreachable or slower than the timeout. fetch() must never block past the timeout.
 */
class MarketSnapshotSource {
public:
    virtual ~MarketSnapshotSource() = default;

    virtual Result<SnapshotPtr> fetch(std::chrono::milliseconds timeout) = 0;

    virtual std::string name() const = 0;
};

}  // namespace signal_ngin
