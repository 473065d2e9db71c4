/*******************************************************************************
    Project: Volcano Controller Manager

    File: controller_supervisor.h

    Description:
        Owns the fixed controller set and runs it as the active phase of the
        controller manager.

        run(stop) starts one thread per controller, blocks until `stop`
        fires and then joins every thread before returning, so a caller
        that sees run() return knows no controller is still reconciling.
*******************************************************************************/

#ifndef CONTROLLER_SUPERVISOR_H
#define CONTROLLER_SUPERVISOR_H

#include "controller/controller.h"
#include "api/cluster_client.h"
#include "plugins/plugin_registry.h"
#include "common/logger.h"
#include "common/options.h"

#include <memory>
#include <vector>

namespace volcano {

class ControllerSupervisor {
private:
    std::vector<std::unique_ptr<Controller>> controllers_;
    std::shared_ptr<Logger> logger_;

public:
    ControllerSupervisor(std::vector<std::unique_ptr<Controller>> controllers,
                         std::shared_ptr<Logger> logger);

    // Job, queue, garbage-collector and pod-group controllers sharing
    // `cluster`. `registry` must outlive the supervisor.
    static std::unique_ptr<ControllerSupervisor> build(std::shared_ptr<ClusterClient> cluster,
                                                       const ServerOption& options,
                                                       const plugins::PluginRegistry& registry,
                                                       std::shared_ptr<Logger> logger);

    void run(const StopSignal& stop);

    std::vector<std::string> controller_names() const;
};

} // namespace volcano

#endif // CONTROLLER_SUPERVISOR_H
