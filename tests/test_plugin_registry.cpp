/*******************************************************************************
    Project: Volcano Controller Manager

    File: test_plugin_registry.cpp

    Description:
        Unit tests for the plugin framework: registry lookup, the built-in
        plugin table, the env plugin and flag-style plugin arguments.

        Test Coverage:
        - Test 1: Built-in plugins are registered
        - Test 2: Unknown names return null, re-registration replaces
        - Test 3: Builders receive the arguments untouched
        - Test 4: Env plugin sets task index variables
        - Test 5: Env plugin marker and argument validation
        - Test 6: Plugin arguments accept flag forms
        - Test 7: Plugin arguments reject malformed input

        Running Tests:
            ./test_plugin_registry
*******************************************************************************/

#include "plugins/plugin_registry.h"
#include "plugins/plugin_arguments.h"
#include "plugins/env/env_plugin.h"
#include "plugins/ssh/ssh_plugin.h"
#include "api/memory_cluster.h"
#include "common/errors.h"
#include "common/logger.h"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace volcano;
using namespace volcano::plugins;

namespace {

// Remembers the arguments it was built with.
class RecordingPlugin : public JobPlugin {
public:
    std::string label;
    std::vector<std::string> arguments;

    RecordingPlugin(const std::string& l, const std::vector<std::string>& args)
        : label(l), arguments(args) {}

    std::string name() const override { return "recording"; }
    void on_pod_create(Pod&, const Job&) override {}
    void on_job_add(Job&) override {}
    void on_job_delete(Job&) override {}
};

bool throws_plugin_error(const std::vector<std::string>& args) {
    bool flag = false;
    std::string text;
    PluginArguments parser("test");
    parser.add_bool("flag", &flag);
    parser.add_string("text", &text);
    try {
        parser.parse(args);
    } catch (const PluginError&) {
        return true;
    }
    return false;
}

std::string env_value(const Container& container, const std::string& name) {
    for (const auto& var : container.env) {
        if (var.name == name) return var.value;
    }
    return "<unset>";
}

} // anonymous namespace

int main() {
    std::ostringstream log_sink;
    auto logger = std::make_shared<Logger>(LogLevel::DEBUG, log_sink);
    auto cluster = std::make_shared<MemoryCluster>();
    PluginClientset clientset{cluster, logger};

    std::cout << "Running plugin registry tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Built-in plugins are registered... ";
        try {
            PluginRegistry registry;
            assert(registry.names().empty());
            register_builtin_plugins(registry);

            assert(registry.contains("ssh"));
            assert(registry.contains("env"));
            std::vector<std::string> names = registry.names();
            assert(names.size() == 2);

            auto ssh = registry.create("ssh", clientset, {"--no-root"});
            assert(ssh != nullptr);
            assert(ssh->name() == "ssh");
            auto* typed = dynamic_cast<SshPlugin*>(ssh.get());
            assert(typed != nullptr);
            assert(typed->config().no_root);

            auto env = registry.create("env", clientset, {});
            assert(env != nullptr);
            assert(env->name() == "env");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Unknown names return null, re-registration replaces... ";
        try {
            PluginRegistry registry;
            assert(registry.create("missing", clientset, {}) == nullptr);
            assert(!registry.contains("missing"));

            registry.register_plugin("recording", [](const PluginClientset&, const std::vector<std::string>& args) {
                return std::unique_ptr<JobPlugin>(new RecordingPlugin("first", args));
            });
            registry.register_plugin("recording", [](const PluginClientset&, const std::vector<std::string>& args) {
                return std::unique_ptr<JobPlugin>(new RecordingPlugin("second", args));
            });

            auto plugin = registry.create("recording", clientset, {});
            assert(plugin != nullptr);
            assert(static_cast<RecordingPlugin*>(plugin.get())->label == "second");
            assert(registry.names().size() == 1);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Builders receive the arguments untouched... ";
        try {
            PluginRegistry registry;
            registry.register_plugin("recording", [](const PluginClientset&, const std::vector<std::string>& args) {
                return std::unique_ptr<JobPlugin>(new RecordingPlugin("only", args));
            });

            std::vector<std::string> args = {"--a=1", "positional", "-b"};
            auto plugin = registry.create("recording", clientset, args);
            assert(static_cast<RecordingPlugin*>(plugin.get())->arguments == args);

            // Each builder validates its own arguments.
            register_builtin_plugins(registry);
            bool threw = false;
            try {
                registry.create("ssh", clientset, {"--unknown"});
            } catch (const PluginError&) {
                threw = true;
            }
            assert(threw);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Env plugin sets task index variables... ";
        try {
            auto plugin = EnvPlugin::create(clientset, {});

            Pod pod;
            pod.name = "lm-worker-12";
            pod.spec.containers.push_back(Container{"main", "busybox", {{"KEEP", "me"}}, {}});
            pod.spec.containers.push_back(Container{"sidecar", "busybox", {}, {}});
            pod.spec.init_containers.push_back(Container{"init", "busybox", {}, {}});

            Job job;
            job.name = "lm";
            plugin->on_pod_create(pod, job);

            for (const auto& container : pod.spec.containers) {
                assert(env_value(container, "VK_TASK_INDEX") == "12");
                assert(env_value(container, "VC_TASK_INDEX") == "12");
            }
            assert(env_value(pod.spec.init_containers[0], "VC_TASK_INDEX") == "12");
            assert(env_value(pod.spec.containers[0], "KEEP") == "me");
            assert(pod.spec.containers[0].env.size() == 3);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Env plugin marker and argument validation... ";
        try {
            auto plugin = EnvPlugin::create(clientset, {});
            uint64_t writes = cluster->mutation_count();

            Job job;
            job.name = "lm";
            plugin->on_job_add(job);
            assert(is_plugin_applied(job, "env"));
            plugin->on_job_add(job);
            assert(job.status.controlled_resources.size() == 1);
            plugin->on_job_delete(job);
            assert(cluster->mutation_count() == writes);

            bool threw = false;
            try {
                EnvPlugin::create(clientset, {"--verbose"});
            } catch (const PluginError&) {
                threw = true;
            }
            assert(threw);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Plugin arguments accept flag forms... ";
        try {
            bool flag = false;
            std::string text = "default";
            PluginArguments parser("test");
            parser.add_bool("flag", &flag);
            parser.add_string("text", &text);

            parser.parse({"-flag", "--text", "hello", "rest", "--flag=false"});
            assert(flag);
            assert(text == "hello");
            assert(parser.remaining().size() == 2);
            assert(parser.remaining()[0] == "rest");

            parser.parse({"--flag=false", "-text=a=b", "--", "-flag"});
            assert(!flag);
            assert(text == "a=b");
            assert(parser.remaining().size() == 1);
            assert(parser.remaining()[0] == "-flag");

            parser.parse({"--flag=T"});
            assert(flag);
            parser.parse({"--flag=0"});
            assert(!flag);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Plugin arguments reject malformed input... ";
        try {
            assert(throws_plugin_error({"--undefined"}));
            assert(throws_plugin_error({"--flag=maybe"}));
            assert(throws_plugin_error({"--text"}));
            assert(throws_plugin_error({"---flag"}));
            assert(throws_plugin_error({"--=x"}));
            assert(!throws_plugin_error({}));
            assert(!throws_plugin_error({"-", "--undefined"}));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
