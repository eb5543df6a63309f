// src/models/label_buffer.cpp

#include "signal_ngin/models/label_buffer.hpp"
#include <cmath>

namespace signal_ngin {

LabelBuffer::LabelBuffer(std::chrono::milliseconds horizon, std::chrono::milliseconds max_delay)
    : horizon_(horizon), max_delay_(max_delay) {}

std::vector<LabeledSample> LabelBuffer::harvest(Timestamp now, Price mid_now) {
    std::vector<LabeledSample> samples;
    while (!entries_.empty() && entries_.front().t + horizon_ <= now) {
        Entry& e = entries_.front();
        if (now - (e.t + horizon_) > max_delay_ || !(e.mid > 0.0) || !(mid_now > 0.0)) {
            ++dropped_;
        } else {
            samples.push_back({std::move(e.x), std::log(mid_now / e.mid)});
        }
        entries_.pop_front();
    }
    return samples;
}

void LabelBuffer::push(Timestamp t, Price mid, Eigen::VectorXd x) {
    entries_.push_back({t, mid, std::move(x)});
}

}  // namespace signal_ngin
