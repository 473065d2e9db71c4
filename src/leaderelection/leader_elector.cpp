/*******************************************************************************
    Project: Volcano Controller Manager

    File: leader_elector.cpp

    Description:
        Acquire, renew and release loops of the lease-based leader elector.
*******************************************************************************/

#include "leaderelection/leader_elector.h"
#include "common/errors.h"

#include <thread>

namespace volcano {
namespace leaderelection {

std::string to_string(ElectionOutcome outcome) {
    switch (outcome) {
        case ElectionOutcome::STOPPED:               return "STOPPED";
        case ElectionOutcome::LEADERSHIP_LOST:       return "LEADERSHIP_LOST";
        case ElectionOutcome::ACTIVE_PHASE_RETURNED: return "ACTIVE_PHASE_RETURNED";
    }
    return "UNKNOWN";
}

//==============================================================================
// Construction
//==============================================================================

LeaderElector::LeaderElector(const LeaderElectionConfig& config, std::shared_ptr<Logger> logger)
    : config_(config),
      clock_(config.clock ? config.clock : std::make_shared<SystemClock>()),
      logger_(logger ? logger->with_component("leader-election")
                     : std::make_shared<Logger>()),
      observed_time_(),
      rng_(std::random_device{}()) {
    if (!config_.lock) {
        throw ConfigError("leader election requires a resource lock");
    }
    if (config_.lease_duration <= config_.renew_deadline) {
        throw ConfigError("leaseDuration must be greater than renewDeadline");
    }
    if (config_.renew_deadline.count() <= kJitterFactor * config_.retry_period.count()) {
        throw ConfigError("renewDeadline must be greater than retryPeriod*JitterFactor");
    }
    if (config_.retry_period.count() < 1) {
        throw ConfigError("retryPeriod must be greater than zero");
    }
    if (!config_.callbacks.on_started_leading) {
        throw ConfigError("OnStartedLeading callback must not be empty");
    }
    if (!config_.callbacks.on_stopped_leading) {
        throw ConfigError("OnStoppedLeading callback must not be empty");
    }
}

//==============================================================================
// Run loop
//==============================================================================

ElectionOutcome LeaderElector::run(const StopSignal& stop) {
    if (!acquire(stop)) {
        logger_->info("stopped before acquiring lease " + config_.lock->describe());
        return ElectionOutcome::STOPPED;
    }

    StopSignal leader_stop = stop.child();
    bool lost = false;

    std::thread renew_thread([this, &leader_stop, &lost]() {
        if (renew_until_lost(leader_stop)) {
            lost = true;
            leader_stop.request_stop();
        }
    });

    try {
        config_.callbacks.on_started_leading(leader_stop);
    } catch (const std::exception& e) {
        logger_->error(std::string("leading phase failed: ") + e.what());
        leader_stop.request_stop();
        renew_thread.join();
        config_.callbacks.on_stopped_leading();
        throw;
    } catch (...) {
        logger_->error("leading phase failed with a non-standard exception");
        leader_stop.request_stop();
        renew_thread.join();
        config_.callbacks.on_stopped_leading();
        throw;
    }

    leader_stop.request_stop();
    renew_thread.join();

    ElectionOutcome outcome;
    if (lost) {
        outcome = ElectionOutcome::LEADERSHIP_LOST;
    } else if (stop.stop_requested()) {
        outcome = ElectionOutcome::STOPPED;
    } else {
        outcome = ElectionOutcome::ACTIVE_PHASE_RETURNED;
    }

    if (config_.release_on_cancel && !lost) {
        release();
    }

    logger_->info("leading phase ended: " + to_string(outcome));
    config_.callbacks.on_stopped_leading();
    return outcome;
}

bool LeaderElector::acquire(const StopSignal& stop) {
    logger_->info("attempting to acquire leader lease " + config_.lock->describe() + "...");

    while (!stop.stop_requested()) {
        bool succeeded = try_acquire_or_renew();
        maybe_report_transition();
        if (succeeded) {
            logger_->info("successfully acquired lease " + config_.lock->describe());
            return true;
        }
        if (stop.wait_for(jittered_retry_period())) {
            break;
        }
    }
    return false;
}

bool LeaderElector::renew_until_lost(const StopSignal& leader_stop) {
    while (!leader_stop.wait_for(config_.retry_period)) {
        auto deadline = std::chrono::steady_clock::now() + config_.renew_deadline;
        bool renewed = false;

        while (true) {
            if (try_acquire_or_renew()) {
                renewed = true;
                break;
            }
            if (std::chrono::steady_clock::now() + config_.retry_period >= deadline) {
                break;
            }
            if (leader_stop.wait_for(config_.retry_period)) {
                return false;
            }
        }

        maybe_report_transition();
        if (!renewed) {
            logger_->error("failed to renew lease " + config_.lock->describe() +
                           ": timed out waiting for the condition");
            return true;
        }
        logger_->debug("successfully renewed lease " + config_.lock->describe());
    }
    return false;
}

//==============================================================================
// Lock record handling
//==============================================================================

bool LeaderElector::try_acquire_or_renew() {
    // Lock backends persist milliseconds; keep observed records comparable.
    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(clock_->now());

    LeaderElectionRecord desired;
    desired.holder_identity = config_.lock->identity();
    desired.lease_duration = config_.lease_duration;
    desired.acquire_time = now;
    desired.renew_time = now;

    std::optional<VersionedRecord> existing;
    try {
        existing = config_.lock->get();
    } catch (const std::exception& e) {
        logger_->error("error retrieving resource lock " + config_.lock->describe() + ": " + e.what());
        return false;
    }

    if (!existing) {
        try {
            config_.lock->create(desired);
        } catch (const std::exception& e) {
            logger_->error("error initially creating leader election record: " + std::string(e.what()));
            return false;
        }
        set_observed(desired, now);
        return true;
    }

    const LeaderElectionRecord& old = existing->record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!observed_record_ || *observed_record_ != old) {
            observed_record_ = old;
            observed_time_ = now;
        }
        if (!old.holder_identity.empty() &&
            observed_time_ + old.lease_duration > now &&
            old.holder_identity != desired.holder_identity) {
            logger_->debug("lock is held by " + old.holder_identity + " and has not yet expired");
            return false;
        }
    }

    if (old.holder_identity == desired.holder_identity) {
        desired.acquire_time = old.acquire_time;
        desired.leader_transitions = old.leader_transitions;
    } else {
        desired.leader_transitions = old.leader_transitions + 1;
    }

    try {
        config_.lock->update(desired, existing->version);
    } catch (const std::exception& e) {
        logger_->error("failed to update lock: " + std::string(e.what()));
        return false;
    }

    set_observed(desired, now);
    return true;
}

bool LeaderElector::release() {
    if (!is_leader()) {
        return true;
    }

    std::optional<VersionedRecord> existing;
    try {
        existing = config_.lock->get();
    } catch (const std::exception& e) {
        logger_->error("failed to read lock for release: " + std::string(e.what()));
        return false;
    }
    if (!existing || existing->record.holder_identity != config_.lock->identity()) {
        return true;
    }

    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(clock_->now());
    LeaderElectionRecord released;
    released.lease_duration = std::chrono::seconds(1);
    released.acquire_time = now;
    released.renew_time = now;
    released.leader_transitions = existing->record.leader_transitions;

    try {
        config_.lock->update(released, existing->version);
    } catch (const std::exception& e) {
        logger_->error("failed to release lock: " + std::string(e.what()));
        return false;
    }

    set_observed(released, now);
    logger_->info("released lease " + config_.lock->describe());
    return true;
}

void LeaderElector::set_observed(const LeaderElectionRecord& record,
                                 std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    observed_record_ = record;
    observed_time_ = now;
}

void LeaderElector::maybe_report_transition() {
    std::string holder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!observed_record_ || observed_record_->holder_identity == reported_leader_) {
            return;
        }
        reported_leader_ = observed_record_->holder_identity;
        holder = reported_leader_;
    }

    if (holder.empty()) return;
    logger_->info("new leader elected: " + holder);
    if (config_.callbacks.on_new_leader) {
        config_.callbacks.on_new_leader(holder);
    }
}

std::chrono::milliseconds LeaderElector::jittered_retry_period() {
    std::uniform_real_distribution<double> dist(0.0, kJitterFactor);
    double factor = 1.0 + dist(rng_);
    return std::chrono::milliseconds(
        static_cast<int64_t>(config_.retry_period.count() * factor));
}

//==============================================================================
// Accessors
//==============================================================================

bool LeaderElector::is_leader() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observed_record_ && observed_record_->holder_identity == config_.lock->identity();
}

std::string LeaderElector::leader() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observed_record_ ? observed_record_->holder_identity : std::string();
}

} // namespace leaderelection
} // namespace volcano
