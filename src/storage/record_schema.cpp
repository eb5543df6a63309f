// src/storage/record_schema.cpp

#include "signal_ngin/storage/record_schema.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

std::string h_suffix(HorizonKey h) {
    return "_" + std::to_string(h) + "s";
}

std::string format_number(double value, int precision) {
    std::ostringstream ss;
    ss << std::setprecision(precision) << value;
    return ss.str();
}

}  // namespace

RecordSchema::RecordSchema(std::vector<std::string> model_ids, std::vector<HorizonKey> horizons,
                           HorizonKey primary_horizon)
    : model_ids_(std::move(model_ids)), horizons_(std::move(horizons)), primary_(primary_horizon) {
    std::sort(horizons_.begin(), horizons_.end());
    if (std::find(horizons_.begin(), horizons_.end(), primary_) == horizons_.end()) {
        throw std::invalid_argument("Primary horizon " + std::to_string(primary_) +
                                    "s is not a configured horizon");
    }

    columns_ = {"wall_time_iso", "tick_ts_ms", "snapshot_ts_ms"};
    for (const auto& name : feature_names()) {
        columns_.push_back(name);
    }
    for (const auto& id : model_ids_) {
        for (HorizonKey h : horizons_) {
            columns_.push_back("p_" + id + h_suffix(h));
        }
    }
    for (HorizonKey h : horizons_) {
        columns_.push_back("p_fused" + h_suffix(h));
        columns_.push_back("p_fused_cal" + h_suffix(h));
    }
    for (const auto& id : model_ids_) {
        columns_.push_back("p_" + id);
    }
    columns_.push_back("p_fused");
    columns_.push_back("p_fused_cal");
    for (HorizonKey h : horizons_) {
        columns_.push_back("status" + h_suffix(h));
        columns_.push_back("realized_ret" + h_suffix(h));
        columns_.push_back("realized_up" + h_suffix(h));
    }
    columns_.push_back("row_status");
}

std::string RecordSchema::header_line() const {
    std::ostringstream ss;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0)
            ss << ",";
        ss << columns_[i];
    }
    return ss.str();
}

std::string RecordSchema::format_probability(const ProbabilityEstimate& est) {
    if (!est.is_available()) {
        return UNAVAILABLE;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << *est.p;
    return ss.str();
}

std::string RecordSchema::format_row(const PredictionRow& row) const {
    std::vector<std::string> fields;
    fields.reserve(columns_.size());

    fields.push_back(core::to_iso8601_utc(row.wall_time));
    fields.push_back(std::to_string(core::to_epoch_ms(row.tick_time)));
    fields.push_back(std::to_string(core::to_epoch_ms(row.snapshot_time)));
    for (double value : row.features.values) {
        fields.push_back(format_number(value, 10));
    }

    for (const auto& id : model_ids_) {
        for (HorizonKey h : horizons_) {
            fields.push_back(format_probability(row.model_estimate(id, h)));
        }
    }

    auto blended = [&row](HorizonKey h) {
        auto it = row.ensemble.find(h);
        if (it == row.ensemble.end()) {
            BlendedProbability missing;
            missing.raw = ProbabilityEstimate::unavailable("not combined");
            missing.calibrated = missing.raw;
            return missing;
        }
        return it->second;
    };

    for (HorizonKey h : horizons_) {
        BlendedProbability b = blended(h);
        fields.push_back(format_probability(b.raw));
        fields.push_back(format_probability(b.calibrated));
    }

    for (const auto& id : model_ids_) {
        fields.push_back(format_probability(row.model_estimate(id, primary_)));
    }
    BlendedProbability primary = blended(primary_);
    fields.push_back(format_probability(primary.raw));
    fields.push_back(format_probability(primary.calibrated));

    for (HorizonKey h : horizons_) {
        auto it = row.outcomes.find(h);
        HorizonOutcome outcome = it == row.outcomes.end() ? HorizonOutcome{} : it->second;
        fields.push_back(outcome_status_to_string(outcome.status));
        if (outcome.status == OutcomeStatus::RESOLVED) {
            fields.push_back(format_number(outcome.realized_return, 10));
            fields.push_back(outcome.realized_up ? "1" : "0");
        } else {
            fields.push_back("");
            fields.push_back("");
        }
    }
    fields.push_back(row_status_to_string(row.row_status()));

    std::ostringstream ss;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0)
            ss << ",";
        ss << fields[i];
    }
    return ss.str();
}

}  // namespace signal_ngin
