// src/resolution/outcome_resolver.cpp

#include "signal_ngin/resolution/outcome_resolver.hpp"
#include <iterator>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

OutcomeResolver::OutcomeResolver(ResolutionConfig config) : config_(std::move(config)) {
    if (config_.grace_ms < 0) {
        throw std::invalid_argument("grace_ms must not be negative");
    }
}

std::vector<ResolutionEvent> OutcomeResolver::evaluate(const PredictionRow& row,
                                                       const PriceTape& tape,
                                                       Timestamp current) const {
    std::vector<ResolutionEvent> events;

    for (const auto& [h, existing] : row.outcomes) {
        if (existing.status != OutcomeStatus::PENDING) {
            continue;
        }
        Timestamp target = row.snapshot_time + horizon_duration(h);
        if (current < target) {
            continue;
        }
        Timestamp deadline = target + grace();

        ResolutionEvent event;
        event.sequence = row.sequence;
        event.tick_time = row.tick_time;
        event.horizon = h;

        auto exit = tape.first_at_or_after(target);
        if (exit && exit->timestamp <= deadline) {
            event.outcome.status = OutcomeStatus::RESOLVED;
            event.outcome.exit_time = exit->timestamp;
            event.outcome.exit_mid = exit->mid;
            event.outcome.realized_return = exit->mid / row.entry_mid - 1.0;
            event.outcome.realized_up = event.outcome.realized_return > 0.0;
        } else if (exit || current > deadline) {
            event.outcome.status = OutcomeStatus::EXPIRED;
            std::string why = exit ? "first snapshot after the target is " +
                                         std::to_string(core::to_epoch_ms(exit->timestamp) -
                                                        core::to_epoch_ms(target)) +
                                         "ms late"
                                   : "no snapshot by the deadline";
            event.gap = EngineError(ErrorCode::RESOLUTION_GAP,
                                    "Horizon " + std::to_string(h) + "s of row " +
                                        std::to_string(row.sequence) + " expired: " + why +
                                        " (grace " + std::to_string(config_.grace_ms) + "ms)",
                                    "OutcomeResolver")
                            .to_string();
        } else {
            continue;
        }
        events.push_back(event);
    }
    return events;
}

Result<std::vector<ResolutionEvent>> OutcomeResolver::resolve(PredictionRow& row,
                                                              const PriceTape& tape,
                                                              Timestamp current) const {
    auto events = evaluate(row, tape, current);
    for (const auto& event : events) {
        auto applied = row.apply_outcome(event.horizon, event.outcome);
        if (applied.is_error()) {
            return forward_error<std::vector<ResolutionEvent>>(applied, "OutcomeResolver");
        }
        if (event.outcome.status == OutcomeStatus::EXPIRED) {
            WARN(event.gap);
        }
    }
    return events;
}

Result<std::vector<ResolutionEvent>> PendingRowSet::resolve_all(const OutcomeResolver& resolver,
                                                                const PriceTape& tape,
                                                                Timestamp current) {
    std::vector<ResolutionEvent> all;
    for (auto& row : rows_) {
        auto events = resolver.resolve(row, tape, current);
        if (events.is_error()) {
            return events;
        }
        for (auto& event : events.take()) {
            all.push_back(std::move(event));
        }
    }
    return all;
}

std::vector<PredictionRow> PendingRowSet::take_final() {
    std::vector<PredictionRow> done;
    while (!rows_.empty() && rows_.front().is_final()) {
        done.push_back(std::move(rows_.front()));
        rows_.pop_front();
    }
    return done;
}

std::vector<PredictionRow> PendingRowSet::drain() {
    std::vector<PredictionRow> all(std::make_move_iterator(rows_.begin()),
                                   std::make_move_iterator(rows_.end()));
    rows_.clear();
    return all;
}

}  // namespace signal_ngin
