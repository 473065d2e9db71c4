/*******************************************************************************
    Project: Volcano Controller Manager

    File: options.h

    Description:
        Process configuration for the controller manager. Most fields are
        pass-through values for collaborators (cluster client rate limits,
        scheduler name); the controller manager only forwards them.

        Defaults live in the constructor, the same way RaftConfig-style
        structs are initialised elsewhere in this code base.
*******************************************************************************/

#ifndef OPTIONS_H
#define OPTIONS_H

#include "common/logger.h"

#include <chrono>
#include <string>
#include <vector>

namespace volcano {

struct ServerOption {
    std::string master;
    std::string kubeconfig;
    float kube_api_qps;
    int kube_api_burst;

    std::string healthz_bind_address;   // empty disables the endpoint

    bool enable_leader_election;
    std::string lock_object_namespace;
    std::string lock_type;              // "file" or "memory"
    std::string lock_dir;
    std::chrono::milliseconds lease_duration;
    std::chrono::milliseconds renew_deadline;
    std::chrono::milliseconds retry_period;

    int worker_threads;
    std::string scheduler_name;
    LogLevel log_level;

    ServerOption()
        : kube_api_qps(50.0f),
          kube_api_burst(100),
          healthz_bind_address("127.0.0.1:11251"),
          enable_leader_election(true),
          lock_object_namespace("volcano-system"),
          lock_type("file"),
          lock_dir("/var/run/volcano"),
          lease_duration(std::chrono::seconds(15)),
          renew_deadline(std::chrono::seconds(10)),
          retry_period(std::chrono::seconds(5)),
          worker_threads(3),
          scheduler_name("volcano"),
          log_level(LogLevel::INFO) {}

    // Throws ConfigError describing the first broken precondition.
    void validate() const;
};

// "500ms", "15s", "2m", "1h" or a bare number of seconds.
// Returns false and leaves `out` untouched on anything else.
bool parse_duration(const std::string& text, std::chrono::milliseconds& out);

// Reads the vc-controller-manager flags (program name excluded) into
// `options`. Value flags take "--flag value" or "--flag=value"; a bare
// --leader-elect consumes the next argument only if it is a boolean.
// Throws ConfigError naming the offending argument.
void parse_command_line(const std::vector<std::string>& args, ServerOption& options);

} // namespace volcano

#endif // OPTIONS_H
