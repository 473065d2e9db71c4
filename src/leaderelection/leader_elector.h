/*******************************************************************************
    Project: Volcano Controller Manager

    File: leader_elector.h

    Description:
        Lease-based leader election over a ResourceLock.

        Candidates poll the lock every retry_period (plus up to 1.2x jitter).
        A candidate takes the lock when it is absent, released, or when the
        holder has not renewed it for lease_duration as measured on the
        candidate's own clock from the moment it first saw the current
        record. The leader renews every retry_period and gives up when it
        could not renew for renew_deadline.

        run() lifecycle:

            acquire ──────────────► on_started_leading(leader_stop)
               │                          │ returns when leader_stop fires
               │ process stop             │ (process stop or renew failure)
               ▼                          ▼
            STOPPED              release (optional) ──► on_stopped_leading
                                                  │
                                 STOPPED / LEADERSHIP_LOST /
                                 ACTIVE_PHASE_RETURNED

        Timing constraints (checked at construction):
            lease_duration > renew_deadline > 1.2 * retry_period > 0

        Fencing is not provided: a leader that stalls past its lease can
        briefly overlap with its successor until its renew fails.
*******************************************************************************/

#ifndef LEADER_ELECTOR_H
#define LEADER_ELECTOR_H

#include "leaderelection/clock.h"
#include "leaderelection/resource_lock.h"
#include "common/logger.h"
#include "common/stop_signal.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace volcano {
namespace leaderelection {

constexpr double kJitterFactor = 1.2;

struct LeaderCallbacks {
    // Runs on the thread that called run(). Must return once `stop` fires.
    std::function<void(const StopSignal& stop)> on_started_leading;
    std::function<void()> on_stopped_leading;
    // Optional. Called whenever the observed holder changes.
    std::function<void(const std::string& identity)> on_new_leader;
};

struct LeaderElectionConfig {
    std::shared_ptr<ResourceLock> lock;
    std::chrono::milliseconds lease_duration;
    std::chrono::milliseconds renew_deadline;
    std::chrono::milliseconds retry_period;
    bool release_on_cancel;
    LeaderCallbacks callbacks;
    std::shared_ptr<Clock> clock;       // SystemClock when null

    LeaderElectionConfig()
        : lease_duration(std::chrono::seconds(15)),
          renew_deadline(std::chrono::seconds(10)),
          retry_period(std::chrono::seconds(5)),
          release_on_cancel(false) {}
};

enum class ElectionOutcome {
    STOPPED,                // process stop before or during leadership
    LEADERSHIP_LOST,        // renew failed within renew_deadline
    ACTIVE_PHASE_RETURNED   // on_started_leading returned on its own
};

std::string to_string(ElectionOutcome outcome);

class LeaderElector {
private:
    LeaderElectionConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::optional<LeaderElectionRecord> observed_record_;
    std::chrono::system_clock::time_point observed_time_;
    std::string reported_leader_;

    std::mt19937 rng_;

    bool acquire(const StopSignal& stop);
    // Returns true if the lease was lost, false if `leader_stop` fired first.
    bool renew_until_lost(const StopSignal& leader_stop);

    std::chrono::milliseconds jittered_retry_period();
    void set_observed(const LeaderElectionRecord& record, std::chrono::system_clock::time_point now);
    void maybe_report_transition();

public:
    // Throws ConfigError if the timing constraints or callbacks are invalid.
    LeaderElector(const LeaderElectionConfig& config, std::shared_ptr<Logger> logger);

    LeaderElector(const LeaderElector&) = delete;
    LeaderElector& operator=(const LeaderElector&) = delete;

    // Blocks until leadership ends or `stop` fires. Never terminates the process.
    ElectionOutcome run(const StopSignal& stop);

    // One acquire/renew attempt. Lock errors are logged and reported as false.
    bool try_acquire_or_renew();

    // Writes an empty holder if this candidate still holds the lock.
    bool release();

    bool is_leader() const;
    std::string leader() const;         // last observed holder, may be empty
    std::string identity() const { return config_.lock->identity(); }
};

} // namespace leaderelection
} // namespace volcano

#endif // LEADER_ELECTOR_H
