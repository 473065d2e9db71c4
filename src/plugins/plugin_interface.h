/*******************************************************************************
    Project: Volcano Controller Manager

    File: plugin_interface.h

    Description:
        Contract every job plugin implements. The job controller builds the
        plugins a job declares (see PluginRegistry) and calls the hooks while
        it reconciles that job:

            on_job_add     once per job, before any of its pods exist
            on_pod_create  for every pod built from the job's task templates,
                           before the pod is submitted
            on_job_delete  while the job is torn down

        One-time side effects of on_job_add are guarded by the job's
        controlled-resources marker "plugin-<name>". Two concurrent
        on_job_add calls for the same job are NOT protected against each
        other; the controller guarantees a single worker per job key.

        Hooks report failure by throwing (PluginError, ApiError). A failed
        on_job_add leaves the marker unset so the next reconcile retries.
*******************************************************************************/

#ifndef PLUGIN_INTERFACE_H
#define PLUGIN_INTERFACE_H

#include "api/cluster_client.h"
#include "api/types.h"
#include "common/logger.h"

#include <memory>
#include <string>

namespace volcano {
namespace plugins {

struct PluginClientset {
    std::shared_ptr<ClusterClient> cluster;
    std::shared_ptr<Logger> logger;
};

class JobPlugin {
public:
    virtual ~JobPlugin() = default;

    virtual std::string name() const = 0;

    virtual void on_pod_create(Pod& pod, const Job& job) = 0;
    virtual void on_job_add(Job& job) = 0;
    virtual void on_job_delete(Job& job) = 0;
};

inline std::string controlled_resource_key(const std::string& plugin_name) {
    return "plugin-" + plugin_name;
}

inline bool is_plugin_applied(const Job& job, const std::string& plugin_name) {
    auto it = job.status.controlled_resources.find(controlled_resource_key(plugin_name));
    return it != job.status.controlled_resources.end() && it->second == plugin_name;
}

inline void mark_plugin_applied(Job& job, const std::string& plugin_name) {
    job.status.controlled_resources[controlled_resource_key(plugin_name)] = plugin_name;
}

} // namespace plugins
} // namespace volcano

#endif // PLUGIN_INTERFACE_H
