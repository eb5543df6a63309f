// src/features/history_window.cpp

#include "signal_ngin/features/history_window.hpp"
#include <algorithm>

namespace signal_ngin {

HistoryWindow::HistoryWindow(std::chrono::milliseconds max_age, size_t max_count)
    : max_age_(max_age), max_count_(max_count) {
    if (max_age_.count() <= 0 || max_count_ == 0) {
        throw std::invalid_argument("HistoryWindow bounds must be positive");
    }
}

Result<void> HistoryWindow::push(SnapshotPtr snapshot) {
    if (!snapshot) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Null snapshot", "HistoryWindow");
    }
    if (!entries_.empty() && snapshot->timestamp <= entries_.back()->timestamp) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Snapshot timestamp is not after the newest history entry",
                                "HistoryWindow");
    }

    entries_.push_back(std::move(snapshot));

    Timestamp cutoff = entries_.back()->timestamp - max_age_;
    while (!entries_.empty() && entries_.front()->timestamp < cutoff) {
        entries_.pop_front();
    }
    while (entries_.size() > max_count_) {
        entries_.pop_front();
    }
    return Result<void>();
}

SnapshotPtr HistoryWindow::latest_at_or_before(Timestamp t) const {
    // First entry strictly after t; the one before it is the answer
    auto it = std::upper_bound(entries_.begin(), entries_.end(), t,
                               [](Timestamp value, const SnapshotPtr& s) {
                                   return value < s->timestamp;
                               });
    if (it == entries_.begin()) {
        return nullptr;
    }
    return *std::prev(it);
}

}  // namespace signal_ngin
