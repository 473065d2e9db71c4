/*******************************************************************************
    Project: Volcano Controller Manager

    File: memory_cluster.h

    Description:
        In-process ClusterClient backed by maps. Used by the tests and by the
        standalone controller manager when no API server client is wired in.

        All calls are serialised on one mutex. Every successful mutating
        call increments mutation_count(), which tests use to prove that an
        idempotent hook performed no writes.
*******************************************************************************/

#ifndef MEMORY_CLUSTER_H
#define MEMORY_CLUSTER_H

#include "api/cluster_client.h"

#include <cstdint>
#include <map>
#include <mutex>

namespace volcano {

class MemoryCluster : public ClusterClient {
private:
    mutable std::mutex mutex_;

    std::map<std::string, Job> jobs_;
    std::map<std::string, Pod> pods_;
    std::map<std::string, Secret> secrets_;
    std::map<std::string, Queue> queues_;
    std::map<std::string, PodGroup> pod_groups_;

    uint64_t next_uid_;
    uint64_t mutation_count_;

    std::string generate_uid();

public:
    MemoryCluster();

    // Entry points used by whoever plays the API server's clients.
    void submit_job(Job job);
    void create_queue(const Queue& queue);
    void set_pod_phase(const std::string& namespace_name, const std::string& name, PodPhase phase);

    std::vector<PodGroup> list_pod_groups() const;
    std::vector<Secret> list_secrets() const;
    uint64_t mutation_count() const;

    // ClusterClient
    std::vector<Job> list_jobs() override;
    std::optional<Job> get_job(const std::string& namespace_name, const std::string& name) override;
    void update_job_status(const std::string& namespace_name, const std::string& name,
                           const JobStatus& status) override;
    void delete_job(const std::string& namespace_name, const std::string& name) override;
    void remove_job(const std::string& namespace_name, const std::string& name) override;

    std::vector<Pod> list_pods(const std::string& namespace_name) override;
    void create_pod(const Pod& pod) override;
    void update_pod(const Pod& pod) override;
    void delete_pod(const std::string& namespace_name, const std::string& name) override;

    std::optional<Secret> get_secret(const std::string& namespace_name, const std::string& name) override;
    void create_secret(const Secret& secret) override;
    void delete_secret(const std::string& namespace_name, const std::string& name) override;

    std::vector<Queue> list_queues() override;
    void update_queue_status(const std::string& name, const QueueStatus& status) override;

    std::optional<PodGroup> get_pod_group(const std::string& namespace_name, const std::string& name) override;
    void create_pod_group(const PodGroup& pod_group) override;
    void delete_pod_group(const std::string& namespace_name, const std::string& name) override;
};

} // namespace volcano

#endif // MEMORY_CLUSTER_H
