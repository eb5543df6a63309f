// include/signal_ngin/models/model_runner.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include "signal_ngin/features/feature_vector.hpp"
#include "signal_ngin/models/model_component.hpp"

namespace signal_ngin {

/**
 * @brief Runs one model component on its own worker thread
 *
 * The worker scores a submitted feature vector, fulfils the future, and only then folds
 * the same features into the component's state. A submission that arrives while the
 * worker is still busy yields an all-unavailable output at once, so a stuck component
 * never queues work.
 *
 * A component that never returns keeps its worker alive; stop() then blocks on join.
 */
class ModelRunner {
public:
    explicit ModelRunner(std::unique_ptr<ModelComponent> model);
    ~ModelRunner();

    ModelRunner(const ModelRunner&) = delete;
    ModelRunner& operator=(const ModelRunner&) = delete;

    std::future<ModelOutput> submit(FeatureVectorPtr features);

    void stop();

    const std::string& id() const {
        return model_->id();
    }

    const std::vector<HorizonKey>& horizons() const {
        return model_->horizons();
    }

    bool busy() const {
        return busy_.load(std::memory_order_acquire);
    }

    /**
     * @brief Number of failed update() calls since start
     */
    size_t update_failures() const {
        return update_failures_.load();
    }

private:
    void worker_loop();
    ModelOutput score_safely(const FeatureVector& features);
    void update_safely(const FeatureVector& features);

    std::unique_ptr<ModelComponent> model_;

    std::mutex mutex_;
    std::condition_variable cv_;
    FeatureVectorPtr job_;
    std::promise<ModelOutput> promise_;
    bool stopping_{false};

    std::atomic<bool> busy_{false};
    std::atomic<size_t> update_failures_{0};
    std::thread worker_;
};

}  // namespace signal_ngin
