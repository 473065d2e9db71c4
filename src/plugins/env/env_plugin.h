/*******************************************************************************
    Project: Volcano Controller Manager

    File: env_plugin.h

    Description:
        Job plugin exporting each pod's task index to its containers as
        VK_TASK_INDEX and VC_TASK_INDEX. Takes no arguments.
*******************************************************************************/

#ifndef ENV_PLUGIN_H
#define ENV_PLUGIN_H

#include "plugins/plugin_interface.h"

#include <memory>
#include <string>
#include <vector>

namespace volcano {
namespace plugins {

constexpr const char* kTaskVkIndex = "VK_TASK_INDEX";
constexpr const char* kTaskIndex = "VC_TASK_INDEX";

class EnvPlugin : public JobPlugin {
public:
    static constexpr const char* kName = "env";

    EnvPlugin() = default;

    static std::unique_ptr<JobPlugin> create(const PluginClientset& clientset,
                                             const std::vector<std::string>& arguments);

    std::string name() const override { return kName; }

    void on_pod_create(Pod& pod, const Job& job) override;
    void on_job_add(Job& job) override;
    void on_job_delete(Job& job) override;
};

} // namespace plugins
} // namespace volcano

#endif // ENV_PLUGIN_H
