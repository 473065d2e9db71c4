/*******************************************************************************
    Project: Volcano Controller Manager

    File: job_controller.cpp

    Description:
        Job reconciliation: plugin hooks, pod group and pod creation,
        status aggregation and deletion clean-up. A key is processed by at
        most one worker at a time.
*******************************************************************************/

#include "controller/job_controller.h"
#include "common/errors.h"

#include <thread>

namespace volcano {

namespace {

bool same_status(const JobStatus& a, const JobStatus& b) {
    return a.phase == b.phase &&
           a.pending == b.pending &&
           a.running == b.running &&
           a.succeeded == b.succeeded &&
           a.failed == b.failed &&
           a.controlled_resources == b.controlled_resources &&
           a.finish_time == b.finish_time;
}

int32_t total_replicas(const Job& job) {
    int32_t total = 0;
    for (const auto& task : job.tasks) {
        total += task.replicas;
    }
    return total;
}

} // anonymous namespace

JobController::JobController(std::shared_ptr<ClusterClient> cluster,
                             const plugins::PluginRegistry& registry,
                             std::shared_ptr<Logger> logger,
                             int worker_threads,
                             std::chrono::milliseconds resync_period)
    : cluster_(std::move(cluster)),
      registry_(registry),
      logger_(logger->with_component("job-controller")),
      worker_threads_(worker_threads),
      resync_period_(resync_period) {
    clientset_.cluster = cluster_;
    clientset_.logger = logger;
}

//==============================================================================
// Run loop and work queue
//==============================================================================

void JobController::run(const StopSignal& stop) {
    logger_->info("starting with " + std::to_string(worker_threads_) + " workers");

    std::vector<std::thread> workers;
    for (int i = 0; i < worker_threads_; i++) {
        workers.emplace_back(&JobController::worker_loop, this, stop);
    }

    do {
        resync();
    } while (!stop.wait_for(resync_period_));

    queue_cv_.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
    logger_->info("stopped");
}

void JobController::resync() {
    std::vector<Job> jobs;
    try {
        jobs = cluster_->list_jobs();
    } catch (const std::exception& e) {
        logger_->error(std::string("failed to list jobs: ") + e.what());
        return;
    }
    for (const auto& job : jobs) {
        enqueue(job_key(job));
    }
}

void JobController::enqueue(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // A key being processed is picked up again by the next resync.
        if (queued_.count(key) || processing_.count(key)) {
            return;
        }
        queue_.push_back(key);
        queued_.insert(key);
    }
    queue_cv_.notify_one();
}

bool JobController::next_key(std::string& key, const StopSignal& stop) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (queue_.empty()) {
        if (stop.stop_requested()) {
            return false;
        }
        queue_cv_.wait_for(lock, std::chrono::milliseconds(100));
    }
    if (stop.stop_requested()) {
        return false;
    }

    key = queue_.front();
    queue_.pop_front();
    queued_.erase(key);
    processing_.insert(key);
    return true;
}

void JobController::done(const std::string& key) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    processing_.erase(key);
}

void JobController::worker_loop(StopSignal stop) {
    std::string key;
    while (next_key(key, stop)) {
        size_t slash = key.find('/');
        try {
            sync_job(key.substr(0, slash), key.substr(slash + 1));
        } catch (const std::exception& e) {
            logger_->error("failed to sync job <" + key + ">: " + e.what());
        }
        done(key);
    }
}

//==============================================================================
// Reconcile
//==============================================================================

JobController::PluginList JobController::load_plugins(const Job& job) const {
    PluginList result;
    for (const auto& [plugin_name, arguments] : job.plugins) {
        std::unique_ptr<plugins::JobPlugin> plugin;
        try {
            plugin = registry_.create(plugin_name, clientset_, arguments);
        } catch (const PluginError& e) {
            throw PluginError("failed to build plugin " + plugin_name + " for job <" +
                              job_key(job) + ">: " + e.what());
        }
        if (!plugin) {
            throw PluginError("failed to get plugin " + plugin_name + " for job <" +
                              job_key(job) + ">");
        }
        result.push_back(std::move(plugin));
    }
    return result;
}

JobController::PluginList JobController::load_plugins_for_cleanup(const Job& job) const {
    PluginList result;
    for (const auto& [plugin_name, arguments] : job.plugins) {
        std::unique_ptr<plugins::JobPlugin> plugin;
        try {
            plugin = registry_.create(plugin_name, clientset_, arguments);
        } catch (const PluginError& e) {
            logger_->error("skipping plugin " + plugin_name + " while removing job <" +
                           job_key(job) + ">: " + e.what());
            continue;
        }
        if (!plugin) {
            logger_->warning("plugin " + plugin_name + " not found while removing job <" +
                             job_key(job) + ">");
            continue;
        }
        result.push_back(std::move(plugin));
    }
    return result;
}

void JobController::sync_job(const std::string& namespace_name, const std::string& name) {
    std::optional<Job> job = cluster_->get_job(namespace_name, name);
    if (!job) {
        return;
    }

    if (job->deletion_requested) {
        kill_job(*job, load_plugins_for_cleanup(*job));
        return;
    }

    PluginList plugins = load_plugins(*job);
    if (is_finished(job->status.phase)) {
        return;
    }

    if (job->status.phase == JobPhase::PENDING && pods_of(*job).empty()) {
        initiate_job(*job, plugins);
    }
    create_missing_pods(*job, plugins);
    update_status(*job);
}

void JobController::kill_job(Job& job, const PluginList& plugins) {
    for (const auto& plugin : plugins) {
        plugin->on_job_delete(job);
    }
    for (const auto& pod : pods_of(job)) {
        cluster_->delete_pod(pod.namespace_name, pod.name);
    }
    cluster_->delete_pod_group(job.namespace_name, job.name);
    cluster_->remove_job(job.namespace_name, job.name);
    logger_->info("removed job <" + job_key(job) + ">");
}

void JobController::initiate_job(Job& job, const PluginList& plugins) {
    JobStatus before = job.status;

    for (const auto& plugin : plugins) {
        plugin->on_job_add(job);
    }

    if (!cluster_->get_pod_group(job.namespace_name, job.name)) {
        PodGroup group;
        group.name = job.name;
        group.namespace_name = job.namespace_name;
        group.owner_uid = job.uid;
        group.queue = job.queue;
        int32_t total = total_replicas(job);
        group.min_member = job.min_available > 0 ? job.min_available : (total > 0 ? total : 1);
        try {
            cluster_->create_pod_group(group);
        } catch (const ApiError& e) {
            if (!is_already_exists(e)) throw;
        }
    }

    if (!same_status(before, job.status)) {
        cluster_->update_job_status(job.namespace_name, job.name, job.status);
    }
    logger_->info("initiated job <" + job_key(job) + ">");
}

void JobController::create_missing_pods(const Job& job, const PluginList& plugins) {
    std::set<std::string> existing;
    for (const auto& pod : pods_of(job)) {
        existing.insert(pod.name);
    }

    for (const auto& task : job.tasks) {
        for (int i = 0; i < task.replicas; i++) {
            std::string pod_name = make_pod_name(job.name, task.name, i);
            if (existing.count(pod_name)) continue;

            Pod pod = build_pod(job, task, i);
            for (const auto& plugin : plugins) {
                plugin->on_pod_create(pod, job);
            }

            try {
                cluster_->create_pod(pod);
                logger_->debug("created pod " + pod.name + " for job <" + job_key(job) + ">");
            } catch (const ApiError& e) {
                if (!is_already_exists(e)) throw;
            }
        }
    }
}

Pod JobController::build_pod(const Job& job, const TaskSpec& task, int index) const {
    Pod pod;
    pod.name = make_pod_name(job.name, task.name, index);
    pod.namespace_name = job.namespace_name;
    pod.owner_uid = job.uid;
    pod.labels = task.pod_template.labels;
    pod.spec = task.pod_template.spec;
    if (pod.spec.scheduler_name.empty()) {
        pod.spec.scheduler_name = job.scheduler_name;
    }
    pod.annotations[kTaskSpecKey] = task.name;
    pod.annotations[kJobNameKey] = job.name;
    pod.annotations[kGroupNameKey] = job.name;
    pod.phase = PodPhase::PENDING;
    return pod;
}

void JobController::update_status(const Job& job) {
    std::optional<Job> current = cluster_->get_job(job.namespace_name, job.name);
    if (!current) {
        return;
    }

    JobStatus status = current->status;
    status.pending = status.running = status.succeeded = status.failed = 0;

    std::vector<Pod> pods = pods_of(job);
    for (const auto& pod : pods) {
        switch (pod.phase) {
            case PodPhase::PENDING:   status.pending++;   break;
            case PodPhase::RUNNING:   status.running++;   break;
            case PodPhase::SUCCEEDED: status.succeeded++; break;
            case PodPhase::FAILED:    status.failed++;    break;
        }
    }

    if (status.failed > 0) {
        status.phase = JobPhase::FAILED;
    } else if (status.succeeded == total_replicas(job)) {
        status.phase = JobPhase::COMPLETED;
    } else if (!pods.empty()) {
        status.phase = JobPhase::RUNNING;
    } else {
        status.phase = JobPhase::PENDING;
    }

    if (is_finished(status.phase) && !status.finish_time) {
        status.finish_time = std::chrono::system_clock::now();
        logger_->info("job <" + job_key(job) + "> " + to_string(status.phase));
    }

    if (!same_status(status, current->status)) {
        cluster_->update_job_status(job.namespace_name, job.name, status);
    }
}

std::vector<Pod> JobController::pods_of(const Job& job) {
    std::vector<Pod> result;
    for (auto& pod : cluster_->list_pods(job.namespace_name)) {
        if (pod.owner_uid == job.uid) {
            result.push_back(std::move(pod));
        }
    }
    return result;
}

} // namespace volcano
