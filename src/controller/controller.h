/*******************************************************************************
    Project: Volcano Controller Manager

    File: controller.h

    Description:
        A controller is an independent reconciliation loop. The supervisor
        starts each one on its own thread and hands it the shared stop
        signal; run() must return promptly once that signal fires.

        Controllers shipped with the manager:
            job-controller        job lifecycle, plugin hooks, pod creation
            queue-controller      per-queue job counts
            garbage-collector     TTL-after-finished clean-up
            podgroup-controller   pod groups for bare pods
*******************************************************************************/

#ifndef CONTROLLER_H
#define CONTROLLER_H

#include "common/stop_signal.h"

#include <string>

namespace volcano {

class Controller {
public:
    virtual ~Controller() = default;

    virtual std::string name() const = 0;

    // Blocks until `stop` fires. Exceptions escaping run() are logged by
    // the supervisor and end only this controller.
    virtual void run(const StopSignal& stop) = 0;
};

} // namespace volcano

#endif // CONTROLLER_H
