/*******************************************************************************
    Project: Volcano Controller Manager

    File: memory_cluster.cpp

    Description:
        In-process ClusterClient. Every object lives in a map keyed by
        namespace/name under one mutex.
*******************************************************************************/

#include "api/memory_cluster.h"
#include "common/errors.h"

namespace volcano {

namespace {

template <typename Map>
typename Map::mapped_type& find_or_throw(Map& objects, const std::string& key, const char* kind) {
    auto it = objects.find(key);
    if (it == objects.end()) {
        throw ApiError(ApiErrorCode::NOT_FOUND, std::string(kind) + " " + key + " not found");
    }
    return it->second;
}

} // namespace

MemoryCluster::MemoryCluster()
    : next_uid_(1),          // uids are "uid-1", "uid-2", ...
      mutation_count_(0) {
}

std::string MemoryCluster::generate_uid() {
    return "uid-" + std::to_string(next_uid_++);
}

//==============================================================================
// Test / standalone entry points
//==============================================================================

void MemoryCluster::submit_job(Job job) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = job_key(job);
    if (jobs_.count(key)) {
        throw ApiError(ApiErrorCode::ALREADY_EXISTS, "job " + key + " already exists");
    }
    if (job.uid.empty()) {
        job.uid = generate_uid();
    }
    jobs_[key] = std::move(job);
    mutation_count_++;
}

void MemoryCluster::create_queue(const Queue& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queues_.count(queue.name)) {
        throw ApiError(ApiErrorCode::ALREADY_EXISTS, "queue " + queue.name + " already exists");
    }
    queues_[queue.name] = queue;
    mutation_count_++;
}

void MemoryCluster::set_pod_phase(const std::string& namespace_name, const std::string& name,
                                  PodPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_or_throw(pods_, object_key(namespace_name, name), "pod").phase = phase;
    mutation_count_++;
}

std::vector<PodGroup> MemoryCluster::list_pod_groups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PodGroup> result;
    for (const auto& [key, pod_group] : pod_groups_) {
        result.push_back(pod_group);
    }
    return result;
}

std::vector<Secret> MemoryCluster::list_secrets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Secret> result;
    for (const auto& [key, secret] : secrets_) {
        result.push_back(secret);
    }
    return result;
}

uint64_t MemoryCluster::mutation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mutation_count_;
}

//==============================================================================
// Jobs
//==============================================================================

std::vector<Job> MemoryCluster::list_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> result;
    for (const auto& [key, job] : jobs_) {
        result.push_back(job);
    }
    return result;
}

std::optional<Job> MemoryCluster::get_job(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(object_key(namespace_name, name));
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

void MemoryCluster::update_job_status(const std::string& namespace_name, const std::string& name,
                                      const JobStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_or_throw(jobs_, object_key(namespace_name, name), "job").status = status;
    mutation_count_++;
}

void MemoryCluster::delete_job(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_or_throw(jobs_, object_key(namespace_name, name), "job").deletion_requested = true;
    mutation_count_++;
}

void MemoryCluster::remove_job(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.erase(object_key(namespace_name, name)) == 0) {
        throw ApiError(ApiErrorCode::NOT_FOUND, "job " + object_key(namespace_name, name) + " not found");
    }
    mutation_count_++;
}

//==============================================================================
// Pods
//==============================================================================

std::vector<Pod> MemoryCluster::list_pods(const std::string& namespace_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Pod> result;
    for (const auto& [key, pod] : pods_) {
        if (namespace_name.empty() || pod.namespace_name == namespace_name) {
            result.push_back(pod);
        }
    }
    return result;
}

void MemoryCluster::create_pod(const Pod& pod) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = object_key(pod.namespace_name, pod.name);
    if (pods_.count(key)) {
        throw ApiError(ApiErrorCode::ALREADY_EXISTS, "pod " + key + " already exists");
    }
    Pod stored = pod;
    if (stored.uid.empty()) {
        stored.uid = generate_uid();
    }
    pods_[key] = std::move(stored);
    mutation_count_++;
}

void MemoryCluster::update_pod(const Pod& pod) {
    std::lock_guard<std::mutex> lock(mutex_);
    Pod& stored = find_or_throw(pods_, object_key(pod.namespace_name, pod.name), "pod");
    stored = pod;
    mutation_count_++;
}

void MemoryCluster::delete_pod(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pods_.erase(object_key(namespace_name, name)) > 0) {
        mutation_count_++;
    }
}

//==============================================================================
// Secrets
//==============================================================================

std::optional<Secret> MemoryCluster::get_secret(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = secrets_.find(object_key(namespace_name, name));
    if (it == secrets_.end()) return std::nullopt;
    return it->second;
}

void MemoryCluster::create_secret(const Secret& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = object_key(secret.namespace_name, secret.name);
    if (secrets_.count(key)) {
        throw ApiError(ApiErrorCode::ALREADY_EXISTS, "secret " + key + " already exists");
    }
    secrets_[key] = secret;
    mutation_count_++;
}

void MemoryCluster::delete_secret(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (secrets_.erase(object_key(namespace_name, name)) > 0) {
        mutation_count_++;
    }
}

//==============================================================================
// Queues
//==============================================================================

std::vector<Queue> MemoryCluster::list_queues() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Queue> result;
    for (const auto& [name, queue] : queues_) {
        result.push_back(queue);
    }
    return result;
}

void MemoryCluster::update_queue_status(const std::string& name, const QueueStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_or_throw(queues_, name, "queue").status = status;
    mutation_count_++;
}

//==============================================================================
// Pod groups
//==============================================================================

std::optional<PodGroup> MemoryCluster::get_pod_group(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pod_groups_.find(object_key(namespace_name, name));
    if (it == pod_groups_.end()) return std::nullopt;
    return it->second;
}

void MemoryCluster::create_pod_group(const PodGroup& pod_group) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = object_key(pod_group.namespace_name, pod_group.name);
    if (pod_groups_.count(key)) {
        throw ApiError(ApiErrorCode::ALREADY_EXISTS, "podgroup " + key + " already exists");
    }
    pod_groups_[key] = pod_group;
    mutation_count_++;
}

void MemoryCluster::delete_pod_group(const std::string& namespace_name, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pod_groups_.erase(object_key(namespace_name, name)) > 0) {
        mutation_count_++;
    }
}

} // namespace volcano
