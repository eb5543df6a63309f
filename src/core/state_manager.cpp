//===== state_manager.cpp =====
#include "signal_ngin/core/state_manager.hpp"
#include <algorithm>

namespace signal_ngin {

Result<void> StateManager::register_component(const ComponentInfo& info) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component ID cannot be empty",
                                "StateManager");
    }

    if (components_.count(info.id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component already registered: " + info.id, "StateManager");
    }

    components_[info.id] = info;
    components_[info.id].last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component not found: " + component_id, "StateManager");
    }

    components_.erase(it);
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<ComponentInfo>(ErrorCode::INVALID_ARGUMENT,
                                         "Component not found: " + component_id,
                                         "StateManager");
    }

    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component not found: " + component_id, "StateManager");
    }

    if (it->second.state != new_state) {
        auto validation = validate_transition(it->second.state, new_state);
        if (validation.is_error()) {
            return make_error<void>(validation.error()->code(),
                                    std::string(validation.error()->what()) + " for " +
                                        component_id,
                                    "StateManager");
        }
        it->second.state = new_state;
    }

    it->second.last_update = std::chrono::system_clock::now();
    if (new_state == ComponentState::ERR_STATE) {
        it->second.error_message = error_message;
    } else {
        it->second.error_message.clear();
    }

    return Result<void>();
}

Result<void> StateManager::validate_transition(ComponentState current_state,
                                               ComponentState new_state) const {
    bool valid = false;
    switch (current_state) {
        case ComponentState::INITIALIZED:
            valid = (new_state == ComponentState::RUNNING ||
                     new_state == ComponentState::ERR_STATE ||
                     new_state == ComponentState::STOPPED);
            break;
        case ComponentState::RUNNING:
            valid = (new_state == ComponentState::PAUSED ||
                     new_state == ComponentState::STOPPED ||
                     new_state == ComponentState::ERR_STATE);
            break;
        case ComponentState::PAUSED:
            valid = (new_state == ComponentState::RUNNING ||
                     new_state == ComponentState::STOPPED ||
                     new_state == ComponentState::ERR_STATE);
            break;
        case ComponentState::ERR_STATE:
            // A model that scores again, or a store whose backlog drained, recovers in place
            valid = (new_state == ComponentState::RUNNING ||
                     new_state == ComponentState::INITIALIZED ||
                     new_state == ComponentState::STOPPED);
            break;
        case ComponentState::STOPPED:
            valid = new_state == ComponentState::INITIALIZED;
            break;
    }

    if (!valid) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid state transition " +
                                    component_state_to_string(current_state) + " -> " +
                                    component_state_to_string(new_state),
                                "StateManager");
    }

    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    if (components_.empty())
        return false;

    for (const auto& [_, info] : components_) {
        if (info.state != ComponentState::INITIALIZED && info.state != ComponentState::RUNNING) {
            return false;
        }
    }
    return true;
}

Result<void> StateManager::update_metrics(
    const std::string& component_id, const std::unordered_map<std::string, double>& metrics) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component not found: " + component_id, "StateManager");
    }

    for (const auto& [key, value] : metrics) {
        it->second.metrics[key] = value;
    }
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

std::vector<ComponentInfo> StateManager::components_in_error() const {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    std::vector<ComponentInfo> failing;
    for (const auto& [_, info] : components_) {
        if (info.state == ComponentState::ERR_STATE) {
            failing.push_back(info);
        }
    }
    std::sort(failing.begin(), failing.end(),
              [](const ComponentInfo& a, const ComponentInfo& b) { return a.id < b.id; });
    return failing;
}

}  // namespace signal_ngin
