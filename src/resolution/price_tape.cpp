// src/resolution/price_tape.cpp

#include "signal_ngin/resolution/price_tape.hpp"
#include <algorithm>
#include <cmath>

namespace signal_ngin {

PriceTape::PriceTape(std::chrono::milliseconds retention) : retention_(retention) {
    if (retention_.count() <= 0) {
        throw std::invalid_argument("PriceTape retention must be positive");
    }
}

Result<void> PriceTape::record(Timestamp timestamp, Price mid) {
    if (!(mid > 0.0) || !std::isfinite(mid)) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Mid price must be positive",
                                "PriceTape");
    }
    if (!entries_.empty() && timestamp <= entries_.back().timestamp) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Tape timestamps must increase",
                                "PriceTape");
    }
    entries_.push_back({timestamp, mid});

    Timestamp cutoff = timestamp - retention_;
    while (!entries_.empty() && entries_.front().timestamp < cutoff) {
        entries_.pop_front();
    }
    return Result<void>();
}

std::optional<TapeEntry> PriceTape::first_at_or_after(Timestamp t) const {
    auto it = std::lower_bound(
        entries_.begin(), entries_.end(), t,
        [](const TapeEntry& e, Timestamp value) { return e.timestamp < value; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace signal_ngin
