// include/signal_ngin/resolution/outcome_resolver.hpp
#pragma once

#include <chrono>
#include <deque>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/resolution/prediction_row.hpp"
#include "signal_ngin/resolution/price_tape.hpp"

namespace signal_ngin {

/**
 * @brief Outcome resolution settings
 */
struct ResolutionConfig : public ConfigBase {
    // Exit snapshots later than target + grace do not count; the horizon expires instead
    int grace_ms{30000};  // Keep at least one cadence

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["grace_ms"] = grace_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("grace_ms"))
            grace_ms = j.at("grace_ms").get<int>();
    }
};

/**
 * @brief A horizon of a row that left PENDING
 */
struct ResolutionEvent {
    uint64_t sequence{0};
    Timestamp tick_time;
    HorizonKey horizon{0};
    HorizonOutcome outcome;
    std::string gap;  // RESOLUTION_GAP error text, set when the horizon expired
};

/**
 * @brief Decides realised outcomes for pending horizons
 *
 * Horizon H of a row predicted from a snapshot at t0 targets T = t0 + H. Nothing is
 * decided while the current snapshot is earlier than T. The exit price is the earliest
 * tape entry at or after T; an exit later than T + grace, or no exit by the time the
 * current snapshot passes T + grace, expires the horizon.
 */
class OutcomeResolver {
public:
    explicit OutcomeResolver(ResolutionConfig config);

    /**
     * @brief Outcomes that can be decided now, without modifying the row
     */
    std::vector<ResolutionEvent> evaluate(const PredictionRow& row, const PriceTape& tape,
                                          Timestamp current) const;

    /**
     * @brief Apply every outcome evaluate() finds
     */
    Result<std::vector<ResolutionEvent>> resolve(PredictionRow& row, const PriceTape& tape,
                                                 Timestamp current) const;

    std::chrono::milliseconds grace() const {
        return std::chrono::milliseconds(config_.grace_ms);
    }

private:
    ResolutionConfig config_;
};

/**
 * @brief Rows predicted in this process that are not yet written, in tick order
 */
class PendingRowSet {
public:
    void add(PredictionRow row) {
        rows_.push_back(std::move(row));
    }

    /**
     * @brief Resolve every row against the tape
     * @return All events, in row order
     */
    Result<std::vector<ResolutionEvent>> resolve_all(const OutcomeResolver& resolver,
                                                     const PriceTape& tape, Timestamp current);

    /**
     * @brief Remove and return the leading rows that are final, preserving tick order
     */
    std::vector<PredictionRow> take_final();

    /**
     * @brief Remove and return every row
     */
    std::vector<PredictionRow> drain();

    size_t size() const {
        return rows_.size();
    }

    bool empty() const {
        return rows_.empty();
    }

    const std::deque<PredictionRow>& rows() const {
        return rows_;
    }

private:
    std::deque<PredictionRow> rows_;
};

}  // namespace signal_ngin
