// include/signal_ngin/models/label_buffer.hpp
#pragma once

#include <Eigen/Dense>
#include <chrono>
#include <deque>
#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief A feature row paired with the log return realised over the horizon
 */
struct LabeledSample {
    Eigen::VectorXd x;
    double y{0.0};
};

/**
 * @brief Holds past inputs of one horizon until the feature stream reaches t + H
 *
 * An entry is labelled by the first tick at or after its target time. Entries whose
 * first qualifying tick arrives later than target + max_delay are dropped unlabelled.
 */
class LabelBuffer {
public:
    LabelBuffer(std::chrono::milliseconds horizon, std::chrono::milliseconds max_delay);

    /**
     * @brief Label every entry whose target has been reached by a tick at `now`
     * @return Samples in the order they were pushed
     */
    std::vector<LabeledSample> harvest(Timestamp now, Price mid_now);

    void push(Timestamp t, Price mid, Eigen::VectorXd x);

    size_t pending() const {
        return entries_.size();
    }

    size_t dropped() const {
        return dropped_;
    }

private:
    struct Entry {
        Timestamp t;
        Price mid;
        Eigen::VectorXd x;
    };

    std::chrono::milliseconds horizon_;
    std::chrono::milliseconds max_delay_;
    std::deque<Entry> entries_;
    size_t dropped_{0};
};

}  // namespace signal_ngin
