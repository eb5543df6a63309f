// include/signal_ngin/data/latest_snapshot_source.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/data/market_snapshot_source.hpp"

namespace signal_ngin {

/**
 * @brief Push-style adapter: producers publish snapshots, the tick loop fetches the latest
 *
 * A snapshot is handed out at most once. fetch() waits up to the timeout for a snapshot
 * that has not been consumed yet and is no older than max_staleness.
 */
class LatestSnapshotSource : public MarketSnapshotSource {
public:
    LatestSnapshotSource(std::shared_ptr<Clock> clock, std::chrono::milliseconds max_staleness,
                         std::string label = "push");

    /**
     * @brief Offer a new snapshot. Invalid books and snapshots older than the current
     * latest are rejected.
     */
    Result<void> publish(SnapshotPtr snapshot);

    Result<SnapshotPtr> fetch(std::chrono::milliseconds timeout) override;

    std::string name() const override {
        return label_;
    }

    size_t published_count() const;

private:
    bool usable_unsafe() const;

    std::shared_ptr<Clock> clock_;
    std::chrono::milliseconds max_staleness_;
    std::string label_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SnapshotPtr latest_;
    bool consumed_{true};
    size_t published_{0};
};

}  // namespace signal_ngin
