/*******************************************************************************
    Project: Volcano Controller Manager

    File: stop_signal.cpp

    Description:
        StopSignal and its parent/child propagation.
*******************************************************************************/

#include "common/stop_signal.h"

#include <algorithm>

namespace volcano {

StopSignal::StopSignal() : state_(std::make_shared<State>()) {
}

StopSignal StopSignal::child() const {
    StopSignal derived;
    bool parent_stopped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        parent_stopped = state_->stopped;
        if (!parent_stopped) {
            auto& children = state_->children;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const std::weak_ptr<State>& c) { return c.expired(); }),
                           children.end());
            children.push_back(derived.state_);
        }
    }
    if (parent_stopped) {
        derived.request_stop();
    }
    return derived;
}

void StopSignal::stop_state(const std::shared_ptr<State>& state) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->stopped) return;
        state->stopped = true;
        children.swap(state->children);
    }
    state->cv.notify_all();

    // Propagate outside the parent's lock; children never lock their parent.
    for (auto& weak_child : children) {
        if (auto child_state = weak_child.lock()) {
            stop_state(child_state);
        }
    }
}

void StopSignal::request_stop() {
    stop_state(state_);
}

size_t StopSignal::child_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->children.size();
}

bool StopSignal::stop_requested() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->stopped;
}

void StopSignal::wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this]() { return state_->stopped; });
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this]() { return state_->stopped; });
}

} // namespace volcano
