/*******************************************************************************
    Project: Volcano Controller Manager

    File: cluster_client.h

    Description:
        Narrow interface to the cluster API server. The real client and its
        object cache live outside this code base; controllers and plugins
        only ever see this interface.

        Failure contract:
        - Every call may throw ApiError.
        - create_* throws ApiError(ALREADY_EXISTS) for a duplicate name.
        - update/delete of a missing object throws ApiError(NOT_FOUND),
          except delete_secret, delete_pod and delete_pod_group, where a
          missing object is success.
*******************************************************************************/

#ifndef CLUSTER_CLIENT_H
#define CLUSTER_CLIENT_H

#include "api/types.h"

#include <optional>
#include <string>
#include <vector>

namespace volcano {

class ClusterClient {
public:
    virtual ~ClusterClient() = default;

    // Jobs
    virtual std::vector<Job> list_jobs() = 0;
    virtual std::optional<Job> get_job(const std::string& namespace_name, const std::string& name) = 0;
    virtual void update_job_status(const std::string& namespace_name, const std::string& name,
                                   const JobStatus& status) = 0;
    // Marks the job for deletion; the job controller finalizes it.
    virtual void delete_job(const std::string& namespace_name, const std::string& name) = 0;
    virtual void remove_job(const std::string& namespace_name, const std::string& name) = 0;

    // Pods
    // An empty namespace lists pods in every namespace.
    virtual std::vector<Pod> list_pods(const std::string& namespace_name) = 0;
    virtual void create_pod(const Pod& pod) = 0;
    virtual void update_pod(const Pod& pod) = 0;
    virtual void delete_pod(const std::string& namespace_name, const std::string& name) = 0;

    // Secrets
    virtual std::optional<Secret> get_secret(const std::string& namespace_name, const std::string& name) = 0;
    virtual void create_secret(const Secret& secret) = 0;
    virtual void delete_secret(const std::string& namespace_name, const std::string& name) = 0;

    // Queues
    virtual std::vector<Queue> list_queues() = 0;
    virtual void update_queue_status(const std::string& name, const QueueStatus& status) = 0;

    // Pod groups
    virtual std::optional<PodGroup> get_pod_group(const std::string& namespace_name, const std::string& name) = 0;
    virtual void create_pod_group(const PodGroup& pod_group) = 0;
    virtual void delete_pod_group(const std::string& namespace_name, const std::string& name) = 0;
};

} // namespace volcano

#endif // CLUSTER_CLIENT_H
