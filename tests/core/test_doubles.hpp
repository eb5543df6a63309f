//===== test_doubles.hpp =====
// Deterministic stand-ins for the clock, the market feed, model components and record sinks
#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/data/market_snapshot_source.hpp"
#include "signal_ngin/models/model_component.hpp"
#include "signal_ngin/storage/record_sink.hpp"

namespace signal_ngin {
namespace testing {

inline Timestamp at_ms(int64_t ms) {
    return core::from_epoch_ms(ms);
}

/**
 * @brief Snapshot with a symmetric book around mid
 */
inline SnapshotPtr make_snapshot(Timestamp t, double mid, double spread = 0.02,
                                 double bid_size = 10.0, double ask_size = 10.0,
                                 double buy_volume = 0.0, double sell_volume = 0.0) {
    auto s = std::make_shared<MarketSnapshot>();
    s->timestamp = t;
    s->received_at = t;
    s->coin = "HYPE";
    s->best_bid = mid - spread / 2.0;
    s->best_ask = mid + spread / 2.0;
    s->bid_size = bid_size;
    s->ask_size = ask_size;
    s->bid_depth = bid_size * 5.0;
    s->ask_depth = ask_size * 5.0;
    s->buy_volume = buy_volume;
    s->sell_volume = sell_volume;
    s->trade_count = (buy_volume > 0.0 ? 1 : 0) + (sell_volume > 0.0 ? 1 : 0);
    return s;
}

/**
 * @brief Clock that only moves when told to
 *
 * sleep_until() jumps straight to the deadline. Once a stop limit is set, a sleep whose
 * deadline lies beyond it reports a stop, which ends a run() loop deterministically.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start) : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    bool sleep_until(Timestamp deadline, const std::atomic<bool>& stop) override {
        if (stop.load()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (limit_ && deadline > *limit_) {
            return false;
        }
        if (deadline > now_) {
            now_ = deadline;
        }
        ++sleeps_;
        return true;
    }

    void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

    void set(Timestamp t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

    void stop_after(Timestamp limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        limit_ = limit;
    }

    size_t sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
    std::optional<Timestamp> limit_;
    size_t sleeps_{0};
};

/**
 * @brief Snapshot source that replays a script
 *
 * A queued nullptr is a gap. With an empty queue the generator, if any, builds the
 * snapshot from the clock; otherwise the feed is unavailable.
 */
class ScriptedSnapshotSource : public MarketSnapshotSource {
public:
    using Generator = std::function<SnapshotPtr(Timestamp)>;

    explicit ScriptedSnapshotSource(std::shared_ptr<Clock> clock = nullptr)
        : clock_(std::move(clock)) {}

    void push(SnapshotPtr snapshot) {
        script_.push_back(std::move(snapshot));
    }

    void push_gap() {
        script_.push_back(nullptr);
    }

    void set_generator(Generator generator) {
        generator_ = std::move(generator);
    }

    /**
     * @brief Called on every fetch, before the snapshot is chosen
     */
    void set_on_fetch(std::function<void()> hook) {
        on_fetch_ = std::move(hook);
    }

    Result<SnapshotPtr> fetch(std::chrono::milliseconds) override {
        ++fetches_;
        if (on_fetch_) {
            on_fetch_();
        }
        SnapshotPtr next;
        if (!script_.empty()) {
            next = script_.front();
            script_.pop_front();
        } else if (generator_ && clock_) {
            next = generator_(clock_->now());
        }
        if (!next) {
            return make_error<SnapshotPtr>(ErrorCode::DATA_UNAVAILABLE, "scripted gap",
                                           "ScriptedSource");
        }
        return next;
    }

    std::string name() const override {
        return "scripted";
    }

    size_t fetches() const {
        return fetches_;
    }

private:
    std::shared_ptr<Clock> clock_;
    std::deque<SnapshotPtr> script_;
    Generator generator_;
    std::function<void()> on_fetch_;
    size_t fetches_{0};
};

/**
 * @brief Model that always reports the same probability
 */
class FixedProbabilityModel : public ModelComponent {
public:
    FixedProbabilityModel(std::string id, std::vector<HorizonKey> horizons, double p,
                          std::set<HorizonKey> unavailable = {})
        : id_(std::move(id)),
          horizons_(std::move(horizons)),
          p_(p),
          unavailable_(std::move(unavailable)) {}

    const std::string& id() const override {
        return id_;
    }
    std::string type() const override {
        return "FIXED";
    }
    const std::vector<HorizonKey>& horizons() const override {
        return horizons_;
    }

    Result<ModelOutput> score(const FeatureVector&) const override {
        ModelOutput out;
        out.model_id = id_;
        for (HorizonKey h : horizons_) {
            out.by_horizon[h] = unavailable_.count(h)
                                    ? ProbabilityEstimate::unavailable("scripted")
                                    : ProbabilityEstimate::of(p_);
        }
        return out;
    }

    Result<void> update(const FeatureVector&) override {
        ++updates_;
        return Result<void>();
    }

    size_t updates() const {
        return updates_.load();
    }

private:
    std::string id_;
    std::vector<HorizonKey> horizons_;
    double p_;
    std::set<HorizonKey> unavailable_;
    std::atomic<size_t> updates_{0};
};

/**
 * @brief Model that throws from score() on chosen calls (1-based)
 */
class ThrowingModel : public ModelComponent {
public:
    ThrowingModel(std::string id, std::vector<HorizonKey> horizons, std::set<size_t> failing_calls,
                  double p = 0.5)
        : id_(std::move(id)),
          horizons_(std::move(horizons)),
          failing_calls_(std::move(failing_calls)),
          p_(p) {}

    const std::string& id() const override {
        return id_;
    }
    std::string type() const override {
        return "THROWING";
    }
    const std::vector<HorizonKey>& horizons() const override {
        return horizons_;
    }

    Result<ModelOutput> score(const FeatureVector&) const override {
        size_t call = ++calls_;
        if (failing_calls_.count(call)) {
            throw std::runtime_error("scripted failure on call " + std::to_string(call));
        }
        ModelOutput out;
        out.model_id = id_;
        for (HorizonKey h : horizons_) {
            out.by_horizon[h] = ProbabilityEstimate::of(p_);
        }
        return out;
    }

    Result<void> update(const FeatureVector&) override {
        return Result<void>();
    }

private:
    std::string id_;
    std::vector<HorizonKey> horizons_;
    std::set<size_t> failing_calls_;
    double p_;
    mutable std::atomic<size_t> calls_{0};
};

/**
 * @brief Model that throws a bare int, not a std::exception, from score() and update()
 */
class IntThrowingModel : public ModelComponent {
public:
    IntThrowingModel(std::string id, std::vector<HorizonKey> horizons)
        : id_(std::move(id)), horizons_(std::move(horizons)) {}

    const std::string& id() const override {
        return id_;
    }
    std::string type() const override {
        return "INT_THROWING";
    }
    const std::vector<HorizonKey>& horizons() const override {
        return horizons_;
    }

    Result<ModelOutput> score(const FeatureVector&) const override {
        throw 42;
    }

    Result<void> update(const FeatureVector&) override {
        throw 7;
    }

private:
    std::string id_;
    std::vector<HorizonKey> horizons_;
};

/**
 * @brief Model whose score() takes a fixed wall time
 */
class SlowModel : public ModelComponent {
public:
    SlowModel(std::string id, std::vector<HorizonKey> horizons, std::chrono::milliseconds delay)
        : id_(std::move(id)), horizons_(std::move(horizons)), delay_(delay) {}

    const std::string& id() const override {
        return id_;
    }
    std::string type() const override {
        return "SLOW";
    }
    const std::vector<HorizonKey>& horizons() const override {
        return horizons_;
    }

    Result<ModelOutput> score(const FeatureVector&) const override {
        std::this_thread::sleep_for(delay_);
        ModelOutput out;
        out.model_id = id_;
        for (HorizonKey h : horizons_) {
            out.by_horizon[h] = ProbabilityEstimate::of(0.9);
        }
        return out;
    }

    Result<void> update(const FeatureVector&) override {
        return Result<void>();
    }

private:
    std::string id_;
    std::vector<HorizonKey> horizons_;
    std::chrono::milliseconds delay_;
};

/**
 * @brief Lines captured by a MemoryRecordSink, shared with the test after the sink is moved
 */
struct SinkState {
    std::vector<std::string> lines;
    size_t fail_next{0};  // Number of upcoming writes that fail
    bool failing{false};  // Every write fails while set
    size_t attempts{0};
    size_t flushes{0};
};

/**
 * @brief In-memory sink with injectable write failures
 */
class MemoryRecordSink : public RecordSink {
public:
    explicit MemoryRecordSink(std::shared_ptr<SinkState> state, std::string label = "memory")
        : state_(std::move(state)), label_(std::move(label)) {}

    Result<void> write_line(const std::string& line) override {
        ++state_->attempts;
        if (state_->failing || state_->fail_next > 0) {
            if (state_->fail_next > 0) {
                --state_->fail_next;
            }
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "injected write failure",
                                    "MemoryRecordSink");
        }
        state_->lines.push_back(line);
        return Result<void>();
    }

    Result<void> flush() override {
        ++state_->flushes;
        if (state_->failing) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "injected flush failure",
                                    "MemoryRecordSink");
        }
        return Result<void>();
    }

    std::string describe() const override {
        return label_;
    }

private:
    std::shared_ptr<SinkState> state_;
    std::string label_;
};

/**
 * @brief Split a CSV line; fields never contain commas in this record format
 */
inline std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    for (char c : line) {
        if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(field);
    return fields;
}

}  // namespace testing
}  // namespace signal_ngin
