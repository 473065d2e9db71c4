/*******************************************************************************
    Project: Volcano Controller Manager

    File: queue_controller.h

    Description:
        Keeps each queue's status in line with the jobs submitted to it:
        pending (PENDING), running (RUNNING) and finished (COMPLETED or
        FAILED) job counts.
*******************************************************************************/

#ifndef QUEUE_CONTROLLER_H
#define QUEUE_CONTROLLER_H

#include "controller/controller.h"
#include "api/cluster_client.h"
#include "common/logger.h"

#include <chrono>
#include <memory>

namespace volcano {

class QueueController : public Controller {
private:
    std::shared_ptr<ClusterClient> cluster_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds period_;

public:
    QueueController(std::shared_ptr<ClusterClient> cluster,
                    std::shared_ptr<Logger> logger,
                    std::chrono::milliseconds period = std::chrono::seconds(1));

    std::string name() const override { return "queue-controller"; }
    void run(const StopSignal& stop) override;

    void sync_queues();
};

} // namespace volcano

#endif // QUEUE_CONTROLLER_H
