/*******************************************************************************
    Project: Volcano Controller Manager

    File: controller_supervisor.cpp

    Description:
        Runs every controller on its own thread and joins them on stop.
*******************************************************************************/

#include "controller/controller_supervisor.h"
#include "controller/garbage_collector.h"
#include "controller/job_controller.h"
#include "controller/podgroup_controller.h"
#include "controller/queue_controller.h"

#include <thread>

namespace volcano {

ControllerSupervisor::ControllerSupervisor(std::vector<std::unique_ptr<Controller>> controllers,
                                           std::shared_ptr<Logger> logger)
    : controllers_(std::move(controllers)),
      logger_(logger->with_component("controller-supervisor")) {
}

std::unique_ptr<ControllerSupervisor> ControllerSupervisor::build(
        std::shared_ptr<ClusterClient> cluster,
        const ServerOption& options,
        const plugins::PluginRegistry& registry,
        std::shared_ptr<Logger> logger) {
    std::vector<std::unique_ptr<Controller>> controllers;
    controllers.push_back(std::make_unique<JobController>(cluster, registry, logger,
                                                          options.worker_threads));
    controllers.push_back(std::make_unique<QueueController>(cluster, logger));
    controllers.push_back(std::make_unique<GarbageCollector>(cluster, logger));
    controllers.push_back(std::make_unique<PodGroupController>(cluster, logger,
                                                               options.scheduler_name));
    return std::make_unique<ControllerSupervisor>(std::move(controllers), logger);
}

void ControllerSupervisor::run(const StopSignal& stop) {
    std::vector<std::thread> threads;

    for (auto& controller : controllers_) {
        Controller* c = controller.get();
        threads.emplace_back([this, c, stop]() {
            try {
                c->run(stop);
            } catch (const std::exception& e) {
                logger_->error("controller " + c->name() + " exited with error: " + e.what());
            }
        });
        logger_->info("started " + controller->name());
    }

    stop.wait();
    logger_->info("stop requested, waiting for " + std::to_string(threads.size()) + " controllers");

    for (auto& t : threads) {
        t.join();
    }
    logger_->info("all controllers stopped");
}

std::vector<std::string> ControllerSupervisor::controller_names() const {
    std::vector<std::string> names;
    for (const auto& controller : controllers_) {
        names.push_back(controller->name());
    }
    return names;
}

} // namespace volcano
