// include/signal_ngin/resolution/price_tape.hpp
#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

struct TapeEntry {
    Timestamp timestamp;
    Price mid{0.0};
};

/**
 * @brief Mid prices of accepted snapshots, kept for outcome resolution
 */
class PriceTape {
public:
    explicit PriceTape(std::chrono::milliseconds retention);

    /**
     * @brief Append an entry; timestamps must be strictly increasing
     */
    Result<void> record(Timestamp timestamp, Price mid);

    /**
     * @brief Earliest entry with timestamp >= t
     */
    std::optional<TapeEntry> first_at_or_after(Timestamp t) const;

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    std::chrono::milliseconds retention() const {
        return retention_;
    }

private:
    std::chrono::milliseconds retention_;
    std::deque<TapeEntry> entries_;
};

}  // namespace signal_ngin
