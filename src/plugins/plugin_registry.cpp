/*******************************************************************************
    Project: Volcano Controller Manager

    File: plugin_registry.cpp

    Description:
        Plugin builder table and the built-in plugin registration.
*******************************************************************************/

#include "plugins/plugin_registry.h"
#include "plugins/env/env_plugin.h"
#include "plugins/ssh/ssh_plugin.h"

namespace volcano {
namespace plugins {

void PluginRegistry::register_plugin(const std::string& name, PluginBuilder builder) {
    builders_[name] = std::move(builder);
}

std::unique_ptr<JobPlugin> PluginRegistry::create(const std::string& name,
                                                  const PluginClientset& clientset,
                                                  const std::vector<std::string>& arguments) const {
    auto it = builders_.find(name);
    if (it == builders_.end()) {
        return nullptr;
    }
    return it->second(clientset, arguments);
}

bool PluginRegistry::contains(const std::string& name) const {
    return builders_.count(name) > 0;
}

std::vector<std::string> PluginRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, builder] : builders_) {
        result.push_back(name);
    }
    return result;
}

void register_builtin_plugins(PluginRegistry& registry) {
    registry.register_plugin(SshPlugin::kName, &SshPlugin::create);
    registry.register_plugin(EnvPlugin::kName, &EnvPlugin::create);
}

} // namespace plugins
} // namespace volcano
