/*******************************************************************************
    Project: Volcano Controller Manager

    File: test_ssh_plugin.cpp

    Description:
        Unit tests for the ssh job plugin against the in-process cluster.

        Test Coverage:
        - Test 1: Option parsing (defaults, --no-root, explicit path, bad flag)
        - Test 2: on_job_add stores the bundle and sets the marker
        - Test 3: on_job_add with the marker set performs no writes
        - Test 4: Failed secret creation leaves the marker unset
        - Test 5: An existing secret is reused
        - Test 6: on_pod_create mounts one volume into every container
        - Test 7: --no-root mounts under /etc/volcano with mode 0755
        - Test 8: on_job_delete removes the secret and tolerates absence

        Running Tests:
            ./test_ssh_plugin
*******************************************************************************/

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

// Rejects every secret write, as an API server outage would.
class SecretRejectingCluster : public MemoryCluster {
public:
    void create_secret(const Secret& secret) override {
        throw ApiError(ApiErrorCode::INTERNAL, "etcdserver: request timed out (" + secret.name + ")");
    }
};

Job make_job() {
    Job job;
    job.name = "mpi";
    job.namespace_name = "default";
    job.uid = "uid-42";

    TaskSpec master;
    master.name = "master";
    master.replicas = 1;
    master.pod_template.spec.containers.push_back(Container{"main", "mpi:latest", {}, {}});
    job.tasks.push_back(master);

    TaskSpec worker;
    worker.name = "worker";
    worker.replicas = 2;
    worker.pod_template.spec.containers.push_back(Container{"main", "mpi:latest", {}, {}});
    job.tasks.push_back(worker);

    job.plugins["ssh"] = {};
    return job;
}

Pod make_pod(int containers) {
    Pod pod;
    pod.name = "mpi-worker-0";
    pod.namespace_name = "default";
    for (int i = 0; i < containers; i++) {
        pod.spec.containers.push_back(Container{"c" + std::to_string(i), "busybox", {}, {}});
    }
    return pod;
}

} // anonymous namespace

int main() {
    std::ostringstream log_sink;
    auto logger = std::make_shared<Logger>(LogLevel::DEBUG, log_sink);

    std::cout << "Running ssh plugin tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Option parsing... ";
        try {
            SshPluginConfig defaults = SshPluginConfig::parse({});
            assert(!defaults.no_root);
            assert(defaults.ssh_key_file_path == "/root/.ssh");
            assert(defaults.volume_mode() == 0600);

            SshPluginConfig no_root = SshPluginConfig::parse({"--no-root"});
            assert(no_root.no_root);
            assert(no_root.ssh_key_file_path == "/etc/volcano/.ssh");
            assert(no_root.volume_mode() == 0755);

            SshPluginConfig custom = SshPluginConfig::parse({"--ssh-key-file-path=/home/mpi/.ssh"});
            assert(custom.ssh_key_file_path == "/home/mpi/.ssh");
            assert(custom.volume_mode() == 0755);

            SshPluginConfig both = SshPluginConfig::parse({"-no-root", "-ssh-key-file-path", "/opt/ssh"});
            assert(both.ssh_key_file_path == "/opt/ssh");

            bool threw = false;
            try {
                SshPluginConfig::parse({"--no-such-flag"});
            } catch (const PluginError& e) {
                threw = std::string(e.what()).find("no-such-flag") != std::string::npos;
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
        std::cout << "Test 2: on_job_add stores the bundle and sets the marker... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            PluginClientset clientset{cluster, logger};
            auto plugin = SshPlugin::create(clientset, {});

            Job job = make_job();
            plugin->on_job_add(job);

            assert(is_plugin_applied(job, "ssh"));
            assert(job.status.controlled_resources.at("plugin-ssh") == "ssh");

            auto secret = cluster->get_secret("default", "mpi-uid-42-ssh");
            assert(secret.has_value());
            assert(secret->owner_uid == "uid-42");
            assert(secret->data.size() == 3);
            assert(secret->data.at("id_rsa").find("BEGIN RSA PRIVATE KEY") != std::string::npos);
            assert(secret->data.at("id_rsa.pub").compare(0, 8, "ssh-rsa ") == 0);
            assert(secret->data.at("config").find("Host mpi-worker-1\n  HostName mpi-worker-1.mpi\n") !=
                   std::string::npos);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: on_job_add with the marker set performs no writes... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            PluginClientset clientset{cluster, logger};
            auto plugin = SshPlugin::create(clientset, {});

            Job job = make_job();
            plugin->on_job_add(job);
            uint64_t writes = cluster->mutation_count();
            std::string key = cluster->get_secret("default", "mpi-uid-42-ssh")->data.at("id_rsa");

            plugin->on_job_add(job);
            plugin->on_job_add(job);

            assert(cluster->mutation_count() == writes);
            assert(cluster->list_secrets().size() == 1);
            assert(cluster->get_secret("default", "mpi-uid-42-ssh")->data.at("id_rsa") == key);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Failed secret creation leaves the marker unset... ";
        try {
            auto cluster = std::make_shared<SecretRejectingCluster>();
            PluginClientset clientset{cluster, logger};
            auto plugin = SshPlugin::create(clientset, {});

            Job job = make_job();
            bool threw = false;
            try {
                plugin->on_job_add(job);
            } catch (const PluginError& e) {
                std::string message = e.what();
                threw = message.find("<default/mpi>") != std::string::npos &&
                        message.find("request timed out") != std::string::npos;
            }
            assert(threw);
            assert(!is_plugin_applied(job, "ssh"));
            assert(job.status.controlled_resources.empty());

            // A retry against a healthy cluster converges.
            auto healthy = std::make_shared<MemoryCluster>();
            auto retry = SshPlugin::create(PluginClientset{healthy, logger}, {});
            retry->on_job_add(job);
            assert(is_plugin_applied(job, "ssh"));
            assert(healthy->get_secret("default", "mpi-uid-42-ssh").has_value());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: An existing secret is reused... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            Secret earlier;
            earlier.name = "mpi-uid-42-ssh";
            earlier.namespace_name = "default";
            earlier.owner_uid = "uid-42";
            earlier.data["id_rsa"] = "from-earlier-attempt";
            cluster->create_secret(earlier);

            auto plugin = SshPlugin::create(PluginClientset{cluster, logger}, {});
            Job job = make_job();
            plugin->on_job_add(job);

            assert(is_plugin_applied(job, "ssh"));
            assert(cluster->list_secrets().size() == 1);
            assert(cluster->get_secret("default", "mpi-uid-42-ssh")->data.at("id_rsa") ==
                   "from-earlier-attempt");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: on_pod_create mounts one volume into every container... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            auto plugin = SshPlugin::create(PluginClientset{cluster, logger}, {});

            Job job = make_job();
            Pod pod = make_pod(3);
            plugin->on_pod_create(pod, job);

            assert(pod.spec.volumes.size() == 1);
            const Volume& volume = pod.spec.volumes[0];
            assert(volume.name == "mpi-uid-42-ssh");
            assert(volume.secret.has_value());
            assert(volume.secret->secret_name == "mpi-uid-42-ssh");
            assert(volume.secret->default_mode == 0600);

            const auto& items = volume.secret->items;
            assert(items.size() == 4);
            assert(items[0].key == "id_rsa" && items[0].path == ".ssh/id_rsa");
            assert(items[1].key == "id_rsa.pub" && items[1].path == ".ssh/id_rsa.pub");
            assert(items[2].key == "id_rsa.pub" && items[2].path == ".ssh/authorized_keys");
            assert(items[3].key == "config" && items[3].path == ".ssh/config");

            for (const auto& container : pod.spec.containers) {
                assert(container.volume_mounts.size() == 1);
                assert(container.volume_mounts[0].name == "mpi-uid-42-ssh");
                assert(container.volume_mounts[0].mount_path == "/root/.ssh");
                assert(container.volume_mounts[0].sub_path == ".ssh");
            }
            assert(cluster->mutation_count() == 0);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: --no-root mounts under /etc/volcano with mode 0755... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            auto plugin = SshPlugin::create(PluginClientset{cluster, logger}, {"--no-root"});

            Job job = make_job();
            Pod pod = make_pod(2);
            plugin->on_pod_create(pod, job);

            assert(pod.spec.volumes.size() == 1);
            assert(pod.spec.volumes[0].secret->default_mode == 0755);
            for (const auto& container : pod.spec.containers) {
                assert(container.volume_mounts.size() == 1);
                assert(container.volume_mounts[0].mount_path == "/etc/volcano/.ssh");
            }
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: on_job_delete removes the secret and tolerates absence... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            auto plugin = SshPlugin::create(PluginClientset{cluster, logger}, {});

            Job job = make_job();
            plugin->on_job_add(job);
            assert(cluster->list_secrets().size() == 1);

            plugin->on_job_delete(job);
            assert(cluster->list_secrets().empty());
            assert(!cluster->get_secret("default", "mpi-uid-42-ssh").has_value());

            plugin->on_job_delete(job);
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
