/*******************************************************************************
    Project: Volcano Controller Manager

    File: podgroup_controller.h

    Description:
        Gives bare pods that ask for our scheduler a single-member pod group
        ("podgroup-{pod uid}") so the scheduler can treat them like jobs.
        Pods that already carry a group annotation are left alone; job pods
        always do.
*******************************************************************************/

#ifndef PODGROUP_CONTROLLER_H
#define PODGROUP_CONTROLLER_H

#include "controller/controller.h"
#include "api/cluster_client.h"
#include "common/logger.h"

#include <chrono>
#include <memory>
#include <string>

namespace volcano {

class PodGroupController : public Controller {
private:
    std::shared_ptr<ClusterClient> cluster_;
    std::shared_ptr<Logger> logger_;
    std::string scheduler_name_;
    std::chrono::milliseconds period_;

    void create_normal_pod_group(Pod& pod);

public:
    PodGroupController(std::shared_ptr<ClusterClient> cluster,
                       std::shared_ptr<Logger> logger,
                       const std::string& scheduler_name,
                       std::chrono::milliseconds period = std::chrono::seconds(1));

    std::string name() const override { return "podgroup-controller"; }
    void run(const StopSignal& stop) override;

    void sync_pods();
};

std::string pod_group_name_for(const Pod& pod);

} // namespace volcano

#endif // PODGROUP_CONTROLLER_H
