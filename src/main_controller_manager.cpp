/*******************************************************************************
    Project: Volcano Controller Manager

    File: main_controller_manager.cpp

    Description:
        Entry point of the vc-controller-manager executable. Parses the
        command line into a ServerOption, wires the built-in plugins and the
        in-process cluster store, installs SIGINT/SIGTERM handlers and hands
        control to ControllerManager::run().

        Exit codes:
            0  shutdown requested by signal
            1  invalid arguments or any other termination (see ExitReason)

        Usage:
            $ ./vc-controller-manager --lock-dir /tmp/volcano --worker-threads 5
            $ ./vc-controller-manager --leader-elect=false --log-level debug
*******************************************************************************/

#include "server/controller_manager.h"
#include "api/memory_cluster.h"
#include "plugins/plugin_registry.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/options.h"
#include "common/stop_signal.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace volcano;

// Set from the signal handler; a watcher thread turns it into request_stop().
std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    ServerOption defaults;
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --master URL                   API server address (default: \"\")\n"
              << "  --kubeconfig PATH              Cluster config file (default: \"\")\n"
              << "  --kube-api-qps QPS             API request rate (default: " << defaults.kube_api_qps << ")\n"
              << "  --kube-api-burst N             API request burst (default: " << defaults.kube_api_burst << ")\n"
              << "  --healthz-bind-address ADDR    Health endpoint, empty disables (default: "
              << defaults.healthz_bind_address << ")\n"
              << "  --leader-elect [BOOL]          Enable leader election (default: true)\n"
              << "  --lock-object-namespace NS     Namespace of the lock (default: "
              << defaults.lock_object_namespace << ")\n"
              << "  --lock-type TYPE               file or memory (default: " << defaults.lock_type << ")\n"
              << "  --lock-dir DIR                 Directory of file locks (default: " << defaults.lock_dir << ")\n"
              << "  --lease-duration DURATION      (default: 15s)\n"
              << "  --renew-deadline DURATION      (default: 10s)\n"
              << "  --retry-period DURATION        (default: 5s)\n"
              << "  --worker-threads N             Job controller workers (default: " << defaults.worker_threads << ")\n"
              << "  --scheduler-name NAME          Scheduler handled by podgroup controller (default: "
              << defaults.scheduler_name << ")\n"
              << "  --log-level LEVEL              debug, info, warning or error (default: info)\n"
              << "  --help                         Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);  // healthz clients may hang up early

    ServerOption options;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    try {
        parse_command_line(std::vector<std::string>(argv + 1, argv + argc), options);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    auto logger = std::make_shared<Logger>(options.log_level);
    logger->info("=== Volcano Controller Manager ===");

    plugins::PluginRegistry registry;
    plugins::register_builtin_plugins(registry);

    auto cluster = std::make_shared<MemoryCluster>();

    StopSignal stop;
    std::thread signal_watcher([&stop]() {
        while (!shutdown_requested && !stop.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        stop.request_stop();
    });

    ControllerManager manager(options, cluster, registry, logger);
    ExitStatus status = manager.run(stop);

    stop.request_stop();
    signal_watcher.join();

    if (status.exit_code() == 0) {
        logger->info("controller manager shutdown complete");
    } else {
        logger->error("controller manager exited: " + to_string(status.reason) + ": " + status.message);
    }
    return status.exit_code();
}
