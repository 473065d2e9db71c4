/*******************************************************************************
    Project: Volcano Controller Manager

    File: garbage_collector.h

    Description:
        Requests deletion of finished jobs once ttl_seconds_after_finished
        has elapsed since their finish time. The job controller performs
        the actual tear-down, so plugin on_job_delete hooks still run.
*******************************************************************************/

#ifndef GARBAGE_COLLECTOR_H
#define GARBAGE_COLLECTOR_H

#include "controller/controller.h"
#include "api/cluster_client.h"
#include "common/logger.h"

#include <chrono>
#include <memory>

namespace volcano {

class GarbageCollector : public Controller {
private:
    std::shared_ptr<ClusterClient> cluster_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds period_;

public:
    GarbageCollector(std::shared_ptr<ClusterClient> cluster,
                     std::shared_ptr<Logger> logger,
                     std::chrono::milliseconds period = std::chrono::seconds(1));

    std::string name() const override { return "garbage-collector"; }
    void run(const StopSignal& stop) override;

    // Returns the number of jobs marked for deletion.
    int collect(std::chrono::system_clock::time_point now);
};

} // namespace volcano

#endif // GARBAGE_COLLECTOR_H
