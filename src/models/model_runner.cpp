// src/models/model_runner.cpp

#include "signal_ngin/models/model_runner.hpp"
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

namespace {

std::string unavailable_reason(const std::string& model_id, const std::string& message) {
    return EngineError(ErrorCode::MODEL_UNAVAILABLE, message, model_id).to_string();
}

}  // namespace

ModelRunner::ModelRunner(std::unique_ptr<ModelComponent> model) : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("ModelRunner requires a model");
    }
    worker_ = std::thread(&ModelRunner::worker_loop, this);
}

ModelRunner::~ModelRunner() {
    stop();
}

void ModelRunner::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::future<ModelOutput> ModelRunner::submit(FeatureVectorPtr features) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stopping_ || busy_.load(std::memory_order_acquire) || job_) {
        std::promise<ModelOutput> rejected;
        rejected.set_value(ModelOutput::all_unavailable(
            model_->id(), model_->horizons(),
            unavailable_reason(model_->id(), stopping_ ? "runner stopped"
                                                       : "still busy with a previous tick")));
        return rejected.get_future();
    }

    promise_ = std::promise<ModelOutput>();
    auto future = promise_.get_future();
    job_ = std::move(features);
    busy_.store(true, std::memory_order_release);
    cv_.notify_one();
    return future;
}

ModelOutput ModelRunner::score_safely(const FeatureVector& features) {
    try {
        auto scored = model_->score(features);
        if (scored.is_error()) {
            return ModelOutput::all_unavailable(
                model_->id(), model_->horizons(),
                unavailable_reason(model_->id(), scored.error()->to_string()));
        }
        ModelOutput out = scored.take();
        out.model_id = model_->id();
        // Horizons the model left out are explicitly unavailable
        for (HorizonKey h : model_->horizons()) {
            if (out.by_horizon.find(h) == out.by_horizon.end()) {
                out.by_horizon[h] = ProbabilityEstimate::unavailable("horizon not reported");
            }
        }
        return out;
    } catch (const std::exception& e) {
        ERROR("Model " << model_->id() << " threw while scoring: " << e.what());
        return ModelOutput::all_unavailable(
            model_->id(), model_->horizons(),
            unavailable_reason(model_->id(), std::string("exception: ") + e.what()));
    } catch (...) {
        ERROR("Model " << model_->id() << " threw a non-standard exception while scoring");
        return ModelOutput::all_unavailable(
            model_->id(), model_->horizons(),
            unavailable_reason(model_->id(), "unknown exception"));
    }
}

void ModelRunner::update_safely(const FeatureVector& features) {
    try {
        auto updated = model_->update(features);
        if (updated.is_error()) {
            ++update_failures_;
            WARN("Model " << model_->id()
                          << " state update failed: " << updated.error()->to_string());
        }
    } catch (const std::exception& e) {
        ++update_failures_;
        ERROR("Model " << model_->id() << " threw while updating: " << e.what());
    } catch (...) {
        ++update_failures_;
        ERROR("Model " << model_->id() << " threw a non-standard exception while updating");
    }
}

void ModelRunner::worker_loop() {
    Logger::register_component(model_->id());

    while (true) {
        FeatureVectorPtr job;
        std::promise<ModelOutput> promise;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || job_ != nullptr; });
            if (!job_) {
                return;
            }
            job = std::move(job_);
            job_.reset();
            promise = std::move(promise_);
        }

        promise.set_value(score_safely(*job));
        update_safely(*job);
        busy_.store(false, std::memory_order_release);
    }
}

}  // namespace signal_ngin
