// include/signal_ngin/storage/record_schema.hpp
#pragma once

#include <string>
#include <vector>
#include "signal_ngin/resolution/prediction_row.hpp"

namespace signal_ngin {

/**
 * @brief Column layout of the per-tick CSV record
 *
 * Fixed for the lifetime of a run. Layout:
 *   wall_time_iso, tick_ts_ms, snapshot_ts_ms, <features>,
 *   p_<model>_<H>s ..., p_fused_<H>s, p_fused_cal_<H>s ...,
 *   p_<model> ..., p_fused, p_fused_cal            (primary horizon)
 *   status_<H>s, realized_ret_<H>s, realized_up_<H>s ..., row_status
 *
 * Unavailable probabilities are written as NA; undecided outcome fields are empty.
 */
class RecordSchema {
public:
    static constexpr const char* UNAVAILABLE = "NA";

    /**
     * @throws std::invalid_argument when the primary horizon is not among the horizons
     */
    RecordSchema(std::vector<std::string> model_ids, std::vector<HorizonKey> horizons,
                 HorizonKey primary_horizon);

    const std::vector<std::string>& columns() const {
        return columns_;
    }

    std::string header_line() const;

    /**
     * @brief One CSV line for the row, matching columns()
     */
    std::string format_row(const PredictionRow& row) const;

    const std::vector<std::string>& model_ids() const {
        return model_ids_;
    }

    const std::vector<HorizonKey>& horizons() const {
        return horizons_;
    }

    HorizonKey primary_horizon() const {
        return primary_;
    }

    static std::string format_probability(const ProbabilityEstimate& est);

private:
    std::vector<std::string> model_ids_;
    std::vector<HorizonKey> horizons_;
    HorizonKey primary_;
    std::vector<std::string> columns_;
};

}  // namespace signal_ngin
