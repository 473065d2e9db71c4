/*******************************************************************************
    Project: Volcano Controller Manager

    File: stop_signal.h

    Description:
        Shared cancellation signal. Copies of a StopSignal refer to the same
        state, so one copy can be handed to every worker while the owner
        keeps another to call request_stop().

        child() derives a signal that stops when its parent stops, but can
        also be stopped on its own without touching the parent. The leader
        elector uses this to cancel the active phase on lease loss while the
        process-wide signal stays untouched.
*******************************************************************************/

#ifndef STOP_SIGNAL_H
#define STOP_SIGNAL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace volcano {

class StopSignal {
private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool stopped = false;
        std::vector<std::weak_ptr<State>> children;
    };

    std::shared_ptr<State> state_;

    static void stop_state(const std::shared_ptr<State>& state);

public:
    StopSignal();

    StopSignal child() const;

    // Children still registered for propagation. Expired ones are dropped
    // on the next child() call.
    size_t child_count() const;

    void request_stop();
    bool stop_requested() const;

    void wait() const;

    // Returns true if the signal fired before the timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const;
};

} // namespace volcano

#endif // STOP_SIGNAL_H
