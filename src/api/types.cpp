/*******************************************************************************
    Project: Volcano Controller Manager

    File: types.cpp

    Description:
        Helpers over the resource model.
*******************************************************************************/

#include "api/types.h"

#include <cctype>

namespace volcano {

const char* const kTaskSpecKey = "volcano.sh/task-spec";
const char* const kJobNameKey = "volcano.sh/job-name";
const char* const kGroupNameKey = "scheduling.k8s.io/group-name";

std::string object_key(const std::string& namespace_name, const std::string& name) {
    return namespace_name + "/" + name;
}

std::string job_key(const Job& job) {
    return object_key(job.namespace_name, job.name);
}

std::string make_pod_name(const std::string& job_name, const std::string& task_name, int index) {
    return job_name + "-" + task_name + "-" + std::to_string(index);
}

std::string task_index_of(const Pod& pod) {
    auto pos = pod.name.rfind('-');
    if (pos == std::string::npos || pos + 1 >= pod.name.size()) {
        return "";
    }
    std::string suffix = pod.name.substr(pos + 1);
    for (char c : suffix) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return "";
    }
    return suffix;
}

bool is_finished(JobPhase phase) {
    return phase == JobPhase::COMPLETED || phase == JobPhase::FAILED;
}

std::string to_string(JobPhase phase) {
    switch (phase) {
        case JobPhase::PENDING:   return "Pending";
        case JobPhase::RUNNING:   return "Running";
        case JobPhase::COMPLETED: return "Completed";
        case JobPhase::FAILED:    return "Failed";
    }
    return "Unknown";
}

std::string to_string(PodPhase phase) {
    switch (phase) {
        case PodPhase::PENDING:   return "Pending";
        case PodPhase::RUNNING:   return "Running";
        case PodPhase::SUCCEEDED: return "Succeeded";
        case PodPhase::FAILED:    return "Failed";
    }
    return "Unknown";
}

} // namespace volcano
