/*******************************************************************************
    Project: Volcano Controller Manager

    File: test_controllers.cpp

    Description:
        Tests for the controllers run by the supervisor, driven against the
        in-process cluster. Reconcile passes are invoked directly except
        where the run loops themselves are under test.

        Test Coverage:
        - Test 1: Supervisor starts every controller and joins on stop
        - Test 2: Job plugins see on_job_add before on_pod_create
        - Test 3: Pods carry job annotations and the pod group is created
        - Test 4: ssh plugin end to end, creation and deletion
        - Test 5: Job phases follow pod phases
        - Test 6: Unknown plugins and bad plugin arguments fail the sync
        - Test 7: Job controller workers reconcile submitted jobs
        - Test 8: Garbage collector honours the TTL
        - Test 9: Queue controller counts jobs per queue
        - Test 10: Pod group controller adopts bare pods
        - Test 11: A job whose plugin no longer builds can still be deleted

        Running Tests:
            ./test_controllers
*******************************************************************************/

#include "controller/controller_supervisor.h"
#include "controller/garbage_collector.h"
#include "controller/job_controller.h"
#include "controller/podgroup_controller.h"
#include "controller/queue_controller.h"
#include "plugins/plugin_registry.h"
#include "api/memory_cluster.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/options.h"

#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace volcano;
using namespace volcano::plugins;
using namespace std::chrono;

namespace {

class CountingController : public Controller {
private:
    std::string name_;
    std::atomic<int>& started_;
    std::atomic<int>& finished_;
    bool fail_;

public:
    CountingController(const std::string& name, std::atomic<int>& started,
                       std::atomic<int>& finished, bool fail = false)
        : name_(name), started_(started), finished_(finished), fail_(fail) {}

    std::string name() const override { return name_; }

    void run(const StopSignal& stop) override {
        started_++;
        if (fail_) {
            throw std::runtime_error("informer cache never synced");
        }
        stop.wait();
        finished_++;
    }
};

struct EventLog {
    std::mutex mutex;
    std::vector<std::string> events;

    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }
};

class RecordingPlugin : public JobPlugin {
private:
    std::shared_ptr<EventLog> log_;

public:
    explicit RecordingPlugin(std::shared_ptr<EventLog> log) : log_(std::move(log)) {}

    std::string name() const override { return "recording"; }

    void on_pod_create(Pod& pod, const Job&) override {
        log_->add("pod:" + pod.name);
        pod.labels["recorded"] = "true";
    }

    void on_job_add(Job& job) override {
        log_->add("add:" + job.name);
        mark_plugin_applied(job, name());
    }

    void on_job_delete(Job& job) override {
        log_->add("delete:" + job.name);
    }
};

Job make_job(const std::string& name, int masters, int workers) {
    Job job;
    job.name = name;
    job.namespace_name = "default";
    job.queue = "default";
    job.scheduler_name = "volcano";

    TaskSpec master;
    master.name = "master";
    master.replicas = masters;
    master.pod_template.labels["role"] = "master";
    master.pod_template.spec.containers.push_back(Container{"main", "mpi:latest", {}, {}});
    job.tasks.push_back(master);

    TaskSpec worker;
    worker.name = "worker";
    worker.replicas = workers;
    worker.pod_template.spec.containers.push_back(Container{"main", "mpi:latest", {}, {}});
    worker.pod_template.spec.containers.push_back(Container{"sidecar", "busybox", {}, {}});
    job.tasks.push_back(worker);
    return job;
}

std::vector<Pod> pods_named_after(MemoryCluster& cluster, const std::string& job_name) {
    std::vector<Pod> result;
    for (const auto& pod : cluster.list_pods("default")) {
        if (pod.annotations.count(kJobNameKey) && pod.annotations.at(kJobNameKey) == job_name) {
            result.push_back(pod);
        }
    }
    return result;
}

bool wait_until(const std::function<bool()>& condition, milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return condition();
}

} // anonymous namespace

int main() {
    std::ostringstream log_sink;
    auto logger = std::make_shared<Logger>(LogLevel::DEBUG, log_sink);

    auto events = std::make_shared<EventLog>();
    PluginRegistry registry;
    register_builtin_plugins(registry);
    registry.register_plugin("recording", [events](const PluginClientset&, const std::vector<std::string>&) {
        return std::unique_ptr<JobPlugin>(new RecordingPlugin(events));
    });

    std::cout << "Running controller tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Supervisor starts every controller and joins on stop... ";
        try {
            std::atomic<int> started(0);
            std::atomic<int> finished(0);

            std::vector<std::unique_ptr<Controller>> controllers;
            controllers.push_back(std::make_unique<CountingController>("a", started, finished));
            controllers.push_back(std::make_unique<CountingController>("b", started, finished));
            controllers.push_back(std::make_unique<CountingController>("broken", started, finished, true));
            controllers.push_back(std::make_unique<CountingController>("c", started, finished));
            ControllerSupervisor supervisor(std::move(controllers), logger);

            StopSignal stop;
            std::atomic<bool> returned(false);
            std::thread runner([&]() {
                supervisor.run(stop);
                returned = true;
            });

            assert(wait_until([&]() { return started.load() == 4; }, seconds(2)));
            std::this_thread::sleep_for(milliseconds(50));
            assert(!returned);

            stop.request_stop();
            runner.join();
            assert(returned);
            // run() only returns after every controller has finished.
            assert(finished == 3);
            assert(log_sink.str().find("controller broken exited with error") != std::string::npos);

            ServerOption options;
            auto cluster = std::make_shared<MemoryCluster>();
            auto built = ControllerSupervisor::build(cluster, options, registry, logger);
            std::vector<std::string> names = built->controller_names();
            assert(names.size() == 4);
            assert(names[0] == "job-controller");
            assert(names[1] == "queue-controller");
            assert(names[2] == "garbage-collector");
            assert(names[3] == "podgroup-controller");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Job plugins see on_job_add before on_pod_create... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 1);
            {
                std::lock_guard<std::mutex> lock(events->mutex);
                events->events.clear();
            }

            Job job = make_job("ordered", 1, 2);
            job.plugins["recording"] = {};
            cluster->submit_job(job);

            controller.sync_job("default", "ordered");

            std::vector<std::string> seen;
            {
                std::lock_guard<std::mutex> lock(events->mutex);
                seen = events->events;
            }
            assert(seen.size() == 4);
            assert(seen[0] == "add:ordered");
            assert(seen[1] == "pod:ordered-master-0");
            assert(seen[2] == "pod:ordered-worker-0");
            assert(seen[3] == "pod:ordered-worker-1");

            auto stored = cluster->get_job("default", "ordered");
            assert(is_plugin_applied(*stored, "recording"));

            // A second pass has nothing left to do.
            uint64_t writes = cluster->mutation_count();
            controller.sync_job("default", "ordered");
            {
                std::lock_guard<std::mutex> lock(events->mutex);
                assert(events->events.size() == 4);
            }
            assert(cluster->mutation_count() == writes);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Pods carry job annotations and the pod group is created... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 1);

            Job job = make_job("lm", 1, 3);
            job.queue = "research";
            job.plugins["recording"] = {};
            job.tasks[1].pod_template.spec.scheduler_name = "custom";
            cluster->submit_job(job);
            std::string uid = cluster->get_job("default", "lm")->uid;
            assert(!uid.empty());

            controller.sync_job("default", "lm");

            std::vector<Pod> pods = pods_named_after(*cluster, "lm");
            assert(pods.size() == 4);
            for (const auto& pod : pods) {
                assert(pod.owner_uid == uid);
                assert(pod.annotations.at(kGroupNameKey) == "lm");
                assert(pod.labels.at("recorded") == "true");
                assert(pod.phase == PodPhase::PENDING);
                assert(!pod.uid.empty());
                if (pod.annotations.at(kTaskSpecKey) == "master") {
                    assert(pod.name == "lm-master-0");
                    assert(pod.labels.at("role") == "master");
                    assert(pod.spec.scheduler_name == "volcano");
                } else {
                    assert(pod.annotations.at(kTaskSpecKey) == "worker");
                    assert(pod.spec.scheduler_name == "custom");
                    assert(pod.spec.containers.size() == 2);
                }
            }

            auto group = cluster->get_pod_group("default", "lm");
            assert(group.has_value());
            assert(group->min_member == 4);
            assert(group->owner_uid == uid);
            assert(group->queue == "research");

            auto status = cluster->get_job("default", "lm")->status;
            assert(status.phase == JobPhase::RUNNING);
            assert(status.pending == 4);

            // min_available overrides the replica total.
            Job gang = make_job("gang", 1, 3);
            gang.min_available = 2;
            cluster->submit_job(gang);
            controller.sync_job("default", "gang");
            assert(cluster->get_pod_group("default", "gang")->min_member == 2);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: ssh plugin end to end, creation and deletion... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 1);

            Job job = make_job("mpi", 1, 2);
            job.plugins["ssh"] = {};
            job.plugins["env"] = {};
            cluster->submit_job(job);
            std::string uid = cluster->get_job("default", "mpi")->uid;
            std::string secret_name = "mpi-" + uid + "-ssh";

            controller.sync_job("default", "mpi");

            auto secret = cluster->get_secret("default", secret_name);
            assert(secret.has_value());
            assert(secret->data.at("config").find("Host mpi-worker-1\n") != std::string::npos);

            auto stored = cluster->get_job("default", "mpi");
            assert(is_plugin_applied(*stored, "ssh"));
            assert(is_plugin_applied(*stored, "env"));

            std::vector<Pod> pods = pods_named_after(*cluster, "mpi");
            assert(pods.size() == 3);
            for (const auto& pod : pods) {
                assert(pod.spec.volumes.size() == 1);
                assert(pod.spec.volumes[0].secret->secret_name == secret_name);
                for (const auto& container : pod.spec.containers) {
                    assert(container.volume_mounts.size() == 1);
                    assert(container.volume_mounts[0].mount_path == "/root/.ssh");
                    bool has_index = false;
                    for (const auto& var : container.env) {
                        if (var.name == "VC_TASK_INDEX") has_index = true;
                    }
                    assert(has_index);
                }
            }

            cluster->delete_job("default", "mpi");
            controller.sync_job("default", "mpi");

            assert(!cluster->get_job("default", "mpi").has_value());
            assert(!cluster->get_secret("default", secret_name).has_value());
            assert(pods_named_after(*cluster, "mpi").empty());
            assert(!cluster->get_pod_group("default", "mpi").has_value());

            // Syncing a job that is gone is a no-op.
            controller.sync_job("default", "mpi");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Job phases follow pod phases... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 1);

            cluster->submit_job(make_job("ok", 1, 1));
            controller.sync_job("default", "ok");
            assert(cluster->get_job("default", "ok")->status.phase == JobPhase::RUNNING);

            cluster->set_pod_phase("default", "ok-master-0", PodPhase::RUNNING);
            cluster->set_pod_phase("default", "ok-worker-0", PodPhase::SUCCEEDED);
            controller.sync_job("default", "ok");
            auto status = cluster->get_job("default", "ok")->status;
            assert(status.phase == JobPhase::RUNNING);
            assert(status.running == 1 && status.succeeded == 1);
            assert(!status.finish_time.has_value());

            cluster->set_pod_phase("default", "ok-master-0", PodPhase::SUCCEEDED);
            controller.sync_job("default", "ok");
            status = cluster->get_job("default", "ok")->status;
            assert(status.phase == JobPhase::COMPLETED);
            assert(status.finish_time.has_value());

            // Finished jobs are left alone.
            uint64_t writes = cluster->mutation_count();
            controller.sync_job("default", "ok");
            assert(cluster->mutation_count() == writes);

            cluster->submit_job(make_job("bad", 1, 2));
            controller.sync_job("default", "bad");
            cluster->set_pod_phase("default", "bad-worker-1", PodPhase::FAILED);
            controller.sync_job("default", "bad");
            status = cluster->get_job("default", "bad")->status;
            assert(status.phase == JobPhase::FAILED);
            assert(status.failed == 1 && status.pending == 2);
            assert(status.finish_time.has_value());

            cluster->submit_job(make_job("empty", 0, 0));
            controller.sync_job("default", "empty");
            assert(cluster->get_job("default", "empty")->status.phase == JobPhase::COMPLETED);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Unknown plugins and bad plugin arguments fail the sync... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 1);

            Job unknown = make_job("unknown", 1, 1);
            unknown.plugins["missing"] = {};
            cluster->submit_job(unknown);

            std::string message;
            try {
                controller.sync_job("default", "unknown");
            } catch (const PluginError& e) {
                message = e.what();
            }
            assert(message.find("failed to get plugin missing") != std::string::npos);
            assert(message.find("<default/unknown>") != std::string::npos);

            Job bad_args = make_job("badargs", 1, 1);
            bad_args.plugins["ssh"] = {"--bogus"};
            cluster->submit_job(bad_args);

            message.clear();
            try {
                controller.sync_job("default", "badargs");
            } catch (const PluginError& e) {
                message = e.what();
            }
            assert(message.find("failed to build plugin ssh") != std::string::npos);

            assert(cluster->list_pods("default").empty());
            assert(cluster->list_secrets().empty());
            assert(cluster->list_pod_groups().empty());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Job controller workers reconcile submitted jobs... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 3, milliseconds(20));

            for (int i = 0; i < 5; i++) {
                Job job = make_job("batch-" + std::to_string(i), 1, 2);
                job.plugins["ssh"] = {};
                cluster->submit_job(job);
            }

            StopSignal stop;
            std::thread runner([&]() { controller.run(stop); });

            bool converged = wait_until([&]() {
                return cluster->list_pods("default").size() == 15 &&
                       cluster->list_secrets().size() == 5;
            }, seconds(10));

            // A job submitted while running is picked up by the next resync.
            cluster->submit_job(make_job("late", 1, 0));
            bool late = wait_until([&]() { return pods_named_after(*cluster, "late").size() == 1; },
                                   seconds(5));

            stop.request_stop();
            runner.join();

            assert(converged);
            assert(late);
            for (const auto& job : cluster->list_jobs()) {
                if (job.name == "late") continue;
                assert(is_plugin_applied(job, "ssh"));
            }
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Garbage collector honours the TTL... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            GarbageCollector collector(cluster, logger);
            auto now = system_clock::now();

            Job expired = make_job("expired", 1, 0);
            expired.ttl_seconds_after_finished = 5;
            expired.status.phase = JobPhase::COMPLETED;
            expired.status.finish_time = now - seconds(10);
            cluster->submit_job(expired);

            Job fresh = expired;
            fresh.name = "fresh";
            fresh.uid = "";
            fresh.ttl_seconds_after_finished = 60;
            cluster->submit_job(fresh);

            Job no_ttl = expired;
            no_ttl.name = "no-ttl";
            no_ttl.uid = "";
            no_ttl.ttl_seconds_after_finished.reset();
            cluster->submit_job(no_ttl);

            Job running = expired;
            running.name = "running";
            running.uid = "";
            running.status.phase = JobPhase::RUNNING;
            cluster->submit_job(running);

            assert(collector.collect(now) == 1);
            assert(cluster->get_job("default", "expired")->deletion_requested);
            assert(!cluster->get_job("default", "fresh")->deletion_requested);
            assert(!cluster->get_job("default", "no-ttl")->deletion_requested);
            assert(!cluster->get_job("default", "running")->deletion_requested);

            // Already marked jobs are not counted twice.
            assert(collector.collect(now) == 0);
            assert(collector.collect(now + seconds(60)) == 1);

            // The job controller finishes the deletion.
            JobController controller(cluster, registry, logger, 1);
            controller.sync_job("default", "expired");
            assert(!cluster->get_job("default", "expired").has_value());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 9: Queue controller counts jobs per queue... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            QueueController controller(cluster, logger);

            Queue default_queue;
            default_queue.name = "default";
            cluster->create_queue(default_queue);
            Queue research;
            research.name = "research";
            research.weight = 4;
            cluster->create_queue(research);
            Queue idle;
            idle.name = "idle";
            cluster->create_queue(idle);

            JobPhase phases[] = {JobPhase::PENDING, JobPhase::RUNNING, JobPhase::RUNNING,
                                 JobPhase::COMPLETED, JobPhase::FAILED};
            for (int i = 0; i < 5; i++) {
                Job job = make_job("q-" + std::to_string(i), 1, 0);
                job.status.phase = phases[i];
                cluster->submit_job(job);
            }
            Job other = make_job("r-0", 1, 0);
            other.queue = "research";
            cluster->submit_job(other);

            controller.sync_queues();

            for (const auto& queue : cluster->list_queues()) {
                if (queue.name == "default") {
                    assert(queue.status.pending == 1);
                    assert(queue.status.running == 2);
                    assert(queue.status.finished == 2);
                } else if (queue.name == "research") {
                    assert(queue.status.pending == 1);
                    assert(queue.status.running == 0);
                    assert(queue.weight == 4);
                } else {
                    assert(queue.status.pending == 0 && queue.status.running == 0 &&
                           queue.status.finished == 0);
                }
            }

            uint64_t writes = cluster->mutation_count();
            controller.sync_queues();
            assert(cluster->mutation_count() == writes);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 10: Pod group controller adopts bare pods... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            PodGroupController controller(cluster, logger, "volcano");

            Pod bare;
            bare.name = "bare";
            bare.namespace_name = "team-a";
            bare.spec.scheduler_name = "volcano";
            cluster->create_pod(bare);

            Pod foreign = bare;
            foreign.name = "foreign";
            foreign.spec.scheduler_name = "default-scheduler";
            cluster->create_pod(foreign);

            Pod grouped = bare;
            grouped.name = "grouped";
            grouped.annotations[kGroupNameKey] = "existing";
            cluster->create_pod(grouped);

            controller.sync_pods();

            std::vector<Pod> pods = cluster->list_pods("team-a");
            assert(pods.size() == 3);
            for (const auto& pod : pods) {
                if (pod.name == "bare") {
                    std::string group_name = pod_group_name_for(pod);
                    assert(group_name == "podgroup-" + pod.uid);
                    assert(pod.annotations.at(kGroupNameKey) == group_name);
                    auto group = cluster->get_pod_group("team-a", group_name);
                    assert(group.has_value());
                    assert(group->min_member == 1);
                    assert(group->owner_uid == pod.uid);
                } else if (pod.name == "foreign") {
                    assert(pod.annotations.empty());
                } else {
                    assert(pod.annotations.at(kGroupNameKey) == "existing");
                }
            }
            assert(cluster->list_pod_groups().size() == 1);

            uint64_t writes = cluster->mutation_count();
            controller.sync_pods();
            assert(cluster->mutation_count() == writes);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 11: A job whose plugin no longer builds can still be deleted... ";
        try {
            auto cluster = std::make_shared<MemoryCluster>();
            JobController controller(cluster, registry, logger, 1);

            Job job = make_job("stale", 1, 1);
            job.plugins["ssh"] = {"--bogus"};
            job.plugins["recording"] = {};
            cluster->submit_job(job);
            std::string uid = cluster->get_job("default", "stale")->uid;

            bool threw = false;
            try {
                controller.sync_job("default", "stale");
            } catch (const PluginError&) {
                threw = true;
            }
            assert(threw);

            // Objects left from a term when the arguments were accepted.
            Pod leftover;
            leftover.name = "stale-master-0";
            leftover.namespace_name = "default";
            leftover.owner_uid = uid;
            cluster->create_pod(leftover);

            PodGroup group;
            group.name = "stale";
            group.namespace_name = "default";
            group.owner_uid = uid;
            cluster->create_pod_group(group);

            cluster->delete_job("default", "stale");
            controller.sync_job("default", "stale");

            assert(!cluster->get_job("default", "stale").has_value());
            assert(cluster->list_pods("default").empty());
            assert(!cluster->get_pod_group("default", "stale").has_value());
            assert(log_sink.str().find("skipping plugin ssh while removing job <default/stale>") !=
                   std::string::npos);

            bool recording_deleted = false;
            {
                std::lock_guard<std::mutex> lock(events->mutex);
                for (const auto& event : events->events) {
                    if (event == "delete:stale") recording_deleted = true;
                }
            }
            assert(recording_deleted);
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
