/*******************************************************************************
    Project: Volcano Controller Manager

    File: queue_controller.cpp

    Description:
        Aggregates per-queue job counts.
*******************************************************************************/

#include "controller/queue_controller.h"

#include <map>

namespace volcano {

QueueController::QueueController(std::shared_ptr<ClusterClient> cluster,
                                 std::shared_ptr<Logger> logger,
                                 std::chrono::milliseconds period)
    : cluster_(std::move(cluster)),
      logger_(logger->with_component("queue-controller")),
      period_(period) {
}

void QueueController::run(const StopSignal& stop) {
    logger_->info("starting");
    do {
        try {
            sync_queues();
        } catch (const std::exception& e) {
            logger_->error(std::string("queue sync failed: ") + e.what());
        }
    } while (!stop.wait_for(period_));
    logger_->info("stopped");
}

void QueueController::sync_queues() {
    std::map<std::string, QueueStatus> counts;
    for (const auto& job : cluster_->list_jobs()) {
        QueueStatus& status = counts[job.queue];
        if (is_finished(job.status.phase)) {
            status.finished++;
        } else if (job.status.phase == JobPhase::RUNNING) {
            status.running++;
        } else {
            status.pending++;
        }
    }

    for (const auto& queue : cluster_->list_queues()) {
        QueueStatus status = counts[queue.name];
        if (status.pending == queue.status.pending &&
            status.running == queue.status.running &&
            status.finished == queue.status.finished) {
            continue;
        }

        try {
            cluster_->update_queue_status(queue.name, status);
        } catch (const std::exception& e) {
            logger_->error("failed to update queue " + queue.name + ": " + e.what());
        }
    }
}

} // namespace volcano
