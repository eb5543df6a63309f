// include/signal_ngin/features/history_window.hpp
#pragma once

#include <chrono>
#include <deque>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/data/market_snapshot.hpp"

namespace signal_ngin {

/**
 * @brief Bounded sliding window of past snapshots, oldest first
 *
 * Bounded both by duration (relative to the newest entry) and by count.
 */
class HistoryWindow {
public:
    HistoryWindow(std::chrono::milliseconds max_age, size_t max_count);

    /**
     * @brief Append a snapshot; timestamps must be strictly increasing
     */
    Result<void> push(SnapshotPtr snapshot);

    /**
     * @brief Latest snapshot with timestamp at or before t, or nullptr
     */
    SnapshotPtr latest_at_or_before(Timestamp t) const;

    const std::deque<SnapshotPtr>& entries() const {
        return entries_;
    }

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    SnapshotPtr newest() const {
        return entries_.empty() ? nullptr : entries_.back();
    }

    void clear() {
        entries_.clear();
    }

private:
    std::chrono::milliseconds max_age_;
    size_t max_count_;
    std::deque<SnapshotPtr> entries_;
};

}  // namespace signal_ngin
