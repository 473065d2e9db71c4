/*******************************************************************************
    Project: Volcano Controller Manager

    File: types.h

    Description:
        Cluster object model consumed and produced by the controllers and
        job plugins: jobs and their tasks, pods, secrets, queues and pod
        groups. Only the fields this code base reads or writes are modelled.

        Objects are plain value types. Controllers read copies from the
        ClusterClient, mutate them locally and write them back.
*******************************************************************************/

#ifndef TYPES_H
#define TYPES_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace volcano {

//==============================================================================
// Pod building blocks
//==============================================================================

struct EnvVar {
    std::string name;
    std::string value;
};

struct VolumeMount {
    std::string name;
    std::string mount_path;
    std::string sub_path;
};

struct KeyToPath {
    std::string key;
    std::string path;
};

struct SecretVolumeSource {
    std::string secret_name;
    std::vector<KeyToPath> items;
    int32_t default_mode;

    SecretVolumeSource() : default_mode(0644) {}
};

struct Volume {
    std::string name;
    std::optional<SecretVolumeSource> secret;
};

struct Container {
    std::string name;
    std::string image;
    std::vector<EnvVar> env;
    std::vector<VolumeMount> volume_mounts;
};

struct PodSpec {
    std::string hostname;
    std::string subdomain;
    std::string scheduler_name;
    std::vector<Container> init_containers;
    std::vector<Container> containers;
    std::vector<Volume> volumes;
};

struct PodTemplate {
    std::map<std::string, std::string> labels;
    PodSpec spec;
};

enum class PodPhase {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED
};

struct Pod {
    std::string name;
    std::string namespace_name;
    std::string uid;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
    std::string owner_uid;      // uid of the owning job, empty for bare pods
    PodSpec spec;
    PodPhase phase;

    Pod() : phase(PodPhase::PENDING) {}
};

//==============================================================================
// Jobs
//==============================================================================

struct TaskSpec {
    std::string name;
    int32_t replicas;
    PodTemplate pod_template;

    TaskSpec() : replicas(0) {}
};

enum class JobPhase {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

struct JobStatus {
    JobPhase phase;
    int32_t pending;
    int32_t running;
    int32_t succeeded;
    int32_t failed;

    // plugin-marker-key ("plugin-<name>") -> marker value
    std::map<std::string, std::string> controlled_resources;

    std::optional<std::chrono::system_clock::time_point> finish_time;

    JobStatus() : phase(JobPhase::PENDING), pending(0), running(0), succeeded(0), failed(0) {}
};

struct Job {
    std::string name;
    std::string namespace_name;
    std::string uid;
    std::string queue;
    std::string scheduler_name;
    int32_t min_available;
    std::vector<TaskSpec> tasks;

    // plugin name -> raw flag-style arguments
    std::map<std::string, std::vector<std::string>> plugins;

    std::optional<int32_t> ttl_seconds_after_finished;
    bool deletion_requested;

    JobStatus status;

    Job() : min_available(0), deletion_requested(false) {}
};

//==============================================================================
// Secrets, queues, pod groups
//==============================================================================

struct Secret {
    std::string name;
    std::string namespace_name;
    std::string owner_uid;
    std::map<std::string, std::string> data;
};

struct QueueStatus {
    int32_t pending;
    int32_t running;
    int32_t finished;

    QueueStatus() : pending(0), running(0), finished(0) {}
};

struct Queue {
    std::string name;
    int32_t weight;
    QueueStatus status;

    Queue() : weight(1) {}
};

struct PodGroup {
    std::string name;
    std::string namespace_name;
    std::string owner_uid;
    std::string queue;
    int32_t min_member;

    PodGroup() : min_member(1) {}
};

//==============================================================================
// Well-known annotation keys and naming helpers
//==============================================================================

extern const char* const kTaskSpecKey;      // "volcano.sh/task-spec"
extern const char* const kJobNameKey;       // "volcano.sh/job-name"
extern const char* const kGroupNameKey;     // "scheduling.k8s.io/group-name"

std::string object_key(const std::string& namespace_name, const std::string& name);
std::string job_key(const Job& job);

// "{job}-{task}-{index}"
std::string make_pod_name(const std::string& job_name, const std::string& task_name, int index);

// Numeric suffix after the last '-' of the pod name, empty when absent.
std::string task_index_of(const Pod& pod);

bool is_finished(JobPhase phase);
std::string to_string(JobPhase phase);
std::string to_string(PodPhase phase);

} // namespace volcano

#endif // TYPES_H
