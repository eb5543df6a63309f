// src/data/latest_snapshot_source.cpp

#include "signal_ngin/data/latest_snapshot_source.hpp"

namespace signal_ngin {

LatestSnapshotSource::LatestSnapshotSource(std::shared_ptr<Clock> clock,
                                           std::chrono::milliseconds max_staleness,
                                           std::string label)
    : clock_(std::move(clock)), max_staleness_(max_staleness), label_(std::move(label)) {
    if (!clock_) {
        throw std::invalid_argument("LatestSnapshotSource requires a clock");
    }
}

Result<void> LatestSnapshotSource::publish(SnapshotPtr snapshot) {
    if (!snapshot) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Null snapshot",
                                "LatestSnapshotSource");
    }
    auto valid = validate_snapshot(*snapshot);
    if (valid.is_error()) {
        return valid;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (latest_ && snapshot->timestamp <= latest_->timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Snapshot is not newer than the latest published one",
                                    "LatestSnapshotSource");
        }
        latest_ = std::move(snapshot);
        consumed_ = false;
        ++published_;
    }
    cv_.notify_all();
    return Result<void>();
}

bool LatestSnapshotSource::usable_unsafe() const {
    if (!latest_ || consumed_) {
        return false;
    }
    return clock_->now() - latest_->timestamp <= max_staleness_;
}

Result<SnapshotPtr> LatestSnapshotSource::fetch(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return usable_unsafe(); })) {
        std::string why = !latest_   ? "No snapshot published yet"
                          : consumed_ ? "No new snapshot since the last fetch"
                                      : "Latest snapshot is stale";
        return make_error<SnapshotPtr>(ErrorCode::DATA_UNAVAILABLE, why, label_);
    }
    consumed_ = true;
    return SnapshotPtr(latest_);
}

size_t LatestSnapshotSource::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

}  // namespace signal_ngin
