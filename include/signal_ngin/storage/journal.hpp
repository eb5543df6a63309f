// include/signal_ngin/storage/journal.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "signal_ngin/resolution/outcome_resolver.hpp"
#include "signal_ngin/resolution/prediction_row.hpp"

namespace signal_ngin {

/**
 * @brief Builds the JSON-lines events of the write-ahead journal
 *
 * Every event carries "event" and "wall_time". Probabilities that are unavailable are
 * written as null with the reason alongside.
 */
class JournalFormat {
public:
    static nlohmann::json session_start(const std::string& run_id, Timestamp wall_time,
                                        const std::vector<std::string>& columns,
                                        const nlohmann::json& config);

    static nlohmann::json prediction(const PredictionRow& row);

    static nlohmann::json resolution(const ResolutionEvent& event, Timestamp wall_time);

    static nlohmann::json session_end(Timestamp wall_time, size_t rows_written,
                                      size_t rows_left_pending);

    static nlohmann::json probability(const ProbabilityEstimate& est);
};

}  // namespace signal_ngin
