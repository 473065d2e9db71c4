/*******************************************************************************
    Project: Volcano Controller Manager

    File: env_plugin.cpp

    Description:
        env job plugin: exposes the task index to every container.
*******************************************************************************/

#include "plugins/env/env_plugin.h"
#include "plugins/plugin_arguments.h"

namespace volcano {
namespace plugins {

std::unique_ptr<JobPlugin> EnvPlugin::create(const PluginClientset& clientset,
                                             const std::vector<std::string>& arguments) {
    (void)clientset;  // no external resources

    // No options, but unknown flags are still rejected.
    PluginArguments flags(kName);
    flags.parse(arguments);

    return std::make_unique<EnvPlugin>();
}

void EnvPlugin::on_pod_create(Pod& pod, const Job& job) {
    (void)job;
    std::string index = task_index_of(pod);

    for (auto& container : pod.spec.containers) {
        container.env.push_back({kTaskVkIndex, index});
        container.env.push_back({kTaskIndex, index});
    }
    for (auto& container : pod.spec.init_containers) {
        container.env.push_back({kTaskVkIndex, index});
        container.env.push_back({kTaskIndex, index});
    }
}

void EnvPlugin::on_job_add(Job& job) {
    if (is_plugin_applied(job, name())) {
        return;
    }
    mark_plugin_applied(job, name());
}

void EnvPlugin::on_job_delete(Job& job) {
    (void)job;
}

} // namespace plugins
} // namespace volcano
