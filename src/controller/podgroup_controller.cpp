/*******************************************************************************
    Project: Volcano Controller Manager

    File: podgroup_controller.cpp

    Description:
        Creates pod groups for bare pods handled by the batch scheduler.
*******************************************************************************/

#include "controller/podgroup_controller.h"
#include "common/errors.h"

namespace volcano {

std::string pod_group_name_for(const Pod& pod) {
    return "podgroup-" + pod.uid;
}

PodGroupController::PodGroupController(std::shared_ptr<ClusterClient> cluster,
                                       std::shared_ptr<Logger> logger,
                                       const std::string& scheduler_name,
                                       std::chrono::milliseconds period)
    : cluster_(std::move(cluster)),
      logger_(logger->with_component("podgroup-controller")),
      scheduler_name_(scheduler_name),
      period_(period) {
}

void PodGroupController::run(const StopSignal& stop) {
    logger_->info("starting, watching pods for scheduler " + scheduler_name_);
    do {
        try {
            sync_pods();
        } catch (const std::exception& e) {
            logger_->error(std::string("pod sync failed: ") + e.what());
        }
    } while (!stop.wait_for(period_));
    logger_->info("stopped");
}

void PodGroupController::sync_pods() {
    for (auto& pod : cluster_->list_pods("")) {
        if (pod.spec.scheduler_name != scheduler_name_) continue;
        if (pod.annotations.count(kGroupNameKey)) continue;

        try {
            create_normal_pod_group(pod);
        } catch (const std::exception& e) {
            logger_->error("failed to create pod group for pod " +
                           object_key(pod.namespace_name, pod.name) + ": " + e.what());
        }
    }
}

void PodGroupController::create_normal_pod_group(Pod& pod) {
    std::string group_name = pod_group_name_for(pod);

    if (!cluster_->get_pod_group(pod.namespace_name, group_name)) {
        PodGroup group;
        group.name = group_name;
        group.namespace_name = pod.namespace_name;
        group.owner_uid = pod.uid;
        group.min_member = 1;
        try {
            cluster_->create_pod_group(group);
        } catch (const ApiError& e) {
            if (!is_already_exists(e)) throw;
        }
    }

    pod.annotations[kGroupNameKey] = group_name;
    cluster_->update_pod(pod);
    logger_->info("pod " + object_key(pod.namespace_name, pod.name) +
                  " joined pod group " + group_name);
}

} // namespace volcano
