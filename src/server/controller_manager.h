/*******************************************************************************
    Project: Volcano Controller Manager

    File: controller_manager.h

    Description:
        Top-level start sequence of the controller manager process:

            validate options ──► health endpoint ──► build controllers
                                                         │
                    leader election disabled ◄───────────┤
                    run controllers, then                │ enabled
                    FINISHED_WITHOUT_LEADER_ELECTION     ▼
                                               identity + lock "vc-controllers"
                                                         │
                                               elect, run controllers while
                                               leading, map the outcome

        run() never terminates the process and never throws for an expected
        termination. Every path ends in an ExitStatus; the caller decides
        between exit and restart. Only SHUTDOWN (stop requested) counts as
        a clean exit.
*******************************************************************************/

#ifndef CONTROLLER_MANAGER_H
#define CONTROLLER_MANAGER_H

#include "api/cluster_client.h"
#include "plugins/plugin_registry.h"
#include "common/logger.h"
#include "common/options.h"
#include "common/stop_signal.h"

#include <memory>
#include <string>

namespace volcano {

class ControllerSupervisor;

namespace leaderelection {
class MemoryLockStore;
}

constexpr const char* kLeaderLockName = "vc-controllers";

enum class ExitReason {
    SHUTDOWN,
    CONFIG_ERROR,
    HEALTHZ_ERROR,
    FINISHED_WITHOUT_LEADER_ELECTION,
    LOCK_CREATION_FAILED,
    LEASE_LOST,
    ACTIVE_PHASE_RETURNED
};

std::string to_string(ExitReason reason);

struct ExitStatus {
    ExitReason reason;
    std::string message;

    int exit_code() const { return reason == ExitReason::SHUTDOWN ? 0 : 1; }
};

class ControllerManager {
private:
    ServerOption options_;
    std::shared_ptr<ClusterClient> cluster_;
    const plugins::PluginRegistry& registry_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<leaderelection::MemoryLockStore> lock_store_;

    ExitStatus run_with_leader_election(const StopSignal& stop, ControllerSupervisor& supervisor);

public:
    ControllerManager(const ServerOption& options,
                      std::shared_ptr<ClusterClient> cluster,
                      const plugins::PluginRegistry& registry,
                      std::shared_ptr<Logger> logger);

    // Store shared by every manager using lock_type "memory".
    void set_lock_store(std::shared_ptr<leaderelection::MemoryLockStore> store);

    ExitStatus run(const StopSignal& stop);
};

} // namespace volcano

#endif // CONTROLLER_MANAGER_H
