/*******************************************************************************
    Project: Volcano Controller Manager

    File: controller_manager.cpp

    Description:
        Startup sequence of the controller manager: validate options, start
        the health endpoint, build the controllers and run them either
        directly or behind the leader elector.
*******************************************************************************/

#include "server/controller_manager.h"
#include "server/healthz_server.h"
#include "controller/controller_supervisor.h"
#include "leaderelection/leader_elector.h"
#include "leaderelection/memory_lock.h"
#include "common/errors.h"

namespace volcano {

std::string to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::SHUTDOWN:                         return "SHUTDOWN";
        case ExitReason::CONFIG_ERROR:                     return "CONFIG_ERROR";
        case ExitReason::HEALTHZ_ERROR:                    return "HEALTHZ_ERROR";
        case ExitReason::FINISHED_WITHOUT_LEADER_ELECTION: return "FINISHED_WITHOUT_LEADER_ELECTION";
        case ExitReason::LOCK_CREATION_FAILED:             return "LOCK_CREATION_FAILED";
        case ExitReason::LEASE_LOST:                       return "LEASE_LOST";
        case ExitReason::ACTIVE_PHASE_RETURNED:            return "ACTIVE_PHASE_RETURNED";
    }
    return "UNKNOWN";
}

ControllerManager::ControllerManager(const ServerOption& options,
                                     std::shared_ptr<ClusterClient> cluster,
                                     const plugins::PluginRegistry& registry,
                                     std::shared_ptr<Logger> logger)
    : options_(options),
      cluster_(std::move(cluster)),
      registry_(registry),
      logger_(std::move(logger)) {
}

void ControllerManager::set_lock_store(std::shared_ptr<leaderelection::MemoryLockStore> store) {
    lock_store_ = std::move(store);
}

ExitStatus ControllerManager::run(const StopSignal& stop) {
    auto log = logger_->with_component("controller-manager");

    try {
        options_.validate();
    } catch (const ConfigError& e) {
        log->error(std::string("invalid options: ") + e.what());
        return {ExitReason::CONFIG_ERROR, e.what()};
    }
    if (!cluster_) {
        return {ExitReason::CONFIG_ERROR, "unable to build cluster config: no cluster client"};
    }

    HealthzServer healthz(options_.healthz_bind_address, logger_);
    if (!options_.healthz_bind_address.empty() && !healthz.start()) {
        return {ExitReason::HEALTHZ_ERROR,
                "failed to start healthz server on " + options_.healthz_bind_address};
    }

    auto supervisor = ControllerSupervisor::build(cluster_, options_, registry_, logger_);

    ExitStatus status;
    if (!options_.enable_leader_election) {
        log->info("leader election disabled, running controllers directly");
        supervisor->run(stop);
        status = {ExitReason::FINISHED_WITHOUT_LEADER_ELECTION, "finished without leader elect"};
    } else {
        status = run_with_leader_election(stop, *supervisor);
    }

    healthz.stop();
    log->info("exiting: " + to_string(status.reason) + " (" + status.message + ")");
    return status;
}

ExitStatus ControllerManager::run_with_leader_election(const StopSignal& stop,
                                                       ControllerSupervisor& supervisor) {
    auto log = logger_->with_component("controller-manager");

    leaderelection::ResourceLockConfig lock_config;
    lock_config.type = options_.lock_type;
    lock_config.namespace_name = options_.lock_object_namespace;
    lock_config.name = kLeaderLockName;
    lock_config.lock_dir = options_.lock_dir;
    lock_config.memory_store = lock_store_ ? lock_store_
                                           : std::make_shared<leaderelection::MemoryLockStore>();

    try {
        lock_config.identity = leaderelection::make_lock_identity();
    } catch (const LockError& e) {
        return {ExitReason::LOCK_CREATION_FAILED, e.what()};
    }

    std::shared_ptr<leaderelection::ResourceLock> lock;
    try {
        lock = leaderelection::new_resource_lock(lock_config);
    } catch (const LockError& e) {
        return {ExitReason::LOCK_CREATION_FAILED,
                std::string("couldn't create resource lock: ") + e.what()};
    }

    leaderelection::LeaderElectionConfig config;
    config.lock = lock;
    config.lease_duration = options_.lease_duration;
    config.renew_deadline = options_.renew_deadline;
    config.retry_period = options_.retry_period;
    config.callbacks.on_started_leading = [&supervisor](const StopSignal& leader_stop) {
        supervisor.run(leader_stop);
    };
    config.callbacks.on_stopped_leading = [log]() {
        log->info("leaderelection lost");
    };

    std::unique_ptr<leaderelection::LeaderElector> elector;
    try {
        elector = std::make_unique<leaderelection::LeaderElector>(config, logger_);
    } catch (const ConfigError& e) {
        return {ExitReason::CONFIG_ERROR, e.what()};
    }

    log->info("running as candidate " + lock->identity() + " for lock " + lock->describe());

    switch (elector->run(stop)) {
        case leaderelection::ElectionOutcome::LEADERSHIP_LOST:
            return {ExitReason::LEASE_LOST, "lost lease"};
        case leaderelection::ElectionOutcome::ACTIVE_PHASE_RETURNED:
            return {ExitReason::ACTIVE_PHASE_RETURNED, "controllers returned while leading"};
        case leaderelection::ElectionOutcome::STOPPED:
            break;
    }
    return {ExitReason::SHUTDOWN, "shutdown requested"};
}

} // namespace volcano
