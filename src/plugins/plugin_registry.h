/*******************************************************************************
    Project: Volcano Controller Manager

    File: plugin_registry.h

    Description:
        Name-keyed table of plugin builders. The table is filled once at
        start-up (register_builtin_plugins) and then only read, so it carries
        no lock. Controllers receive it by reference.

        The registry never looks at plugin arguments; each builder parses
        its own.
*******************************************************************************/

#ifndef PLUGIN_REGISTRY_H
#define PLUGIN_REGISTRY_H

#include "plugins/plugin_interface.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace volcano {
namespace plugins {

using PluginBuilder = std::function<std::unique_ptr<JobPlugin>(
    const PluginClientset& clientset, const std::vector<std::string>& arguments)>;

class PluginRegistry {
private:
    std::map<std::string, PluginBuilder> builders_;

public:
    // A second registration under the same name replaces the first.
    void register_plugin(const std::string& name, PluginBuilder builder);

    // Returns nullptr when no builder is registered under `name`.
    // Builders may throw PluginError for invalid arguments.
    std::unique_ptr<JobPlugin> create(const std::string& name,
                                      const PluginClientset& clientset,
                                      const std::vector<std::string>& arguments) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
};

// Registers every plugin shipped with the controller manager ("ssh", "env").
void register_builtin_plugins(PluginRegistry& registry);

} // namespace plugins
} // namespace volcano

#endif // PLUGIN_REGISTRY_H
