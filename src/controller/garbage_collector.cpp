/*******************************************************************************
    Project: Volcano Controller Manager

    File: garbage_collector.cpp

    Description:
        Deletes finished jobs once their TTL has passed.
*******************************************************************************/

#include "controller/garbage_collector.h"

namespace volcano {

GarbageCollector::GarbageCollector(std::shared_ptr<ClusterClient> cluster,
                                   std::shared_ptr<Logger> logger,
                                   std::chrono::milliseconds period)
    : cluster_(std::move(cluster)),
      logger_(logger->with_component("garbage-collector")),
      period_(period) {
}

void GarbageCollector::run(const StopSignal& stop) {
    logger_->info("starting");
    do {
        try {
            collect(std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            logger_->error(std::string("collection pass failed: ") + e.what());
        }
    } while (!stop.wait_for(period_));
    logger_->info("stopped");
}

int GarbageCollector::collect(std::chrono::system_clock::time_point now) {
    int collected = 0;

    for (const auto& job : cluster_->list_jobs()) {
        if (job.deletion_requested || !is_finished(job.status.phase)) continue;
        if (!job.ttl_seconds_after_finished || !job.status.finish_time) continue;

        auto expire_at = *job.status.finish_time +
                         std::chrono::seconds(*job.ttl_seconds_after_finished);
        if (now < expire_at) continue;

        try {
            cluster_->delete_job(job.namespace_name, job.name);
            collected++;
            logger_->info("job <" + job_key(job) + "> expired, deleting");
        } catch (const std::exception& e) {
            logger_->error("failed to delete expired job <" + job_key(job) + ">: " + e.what());
        }
    }
    return collected;
}

} // namespace volcano
