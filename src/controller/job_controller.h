/*******************************************************************************
    Project: Volcano Controller Manager

    File: job_controller.h

    Description:
        Reconciles jobs: runs the plugin hooks a job declares, creates the
        job's pod group and pods, and folds pod phases back into the job
        status.

        Keys ("namespace/name") are fed into a de-duplicating work queue by
        a periodic resync of the job list and drained by `worker_threads`
        workers. A key is handed to at most one worker at a time, which is
        what keeps two on_job_add calls for one job from racing.

        Sync order for one job:
            1. deletion requested -> on_job_delete, delete pods and pod
               group, remove the job
            2. PENDING without pods -> on_job_add for every plugin, create
               pod group, persist status (plugin markers)
            3. create missing pods, on_pod_create before each submission
            4. recompute counts and phase

        A failed sync is logged and retried at the next resync.
*******************************************************************************/

#ifndef JOB_CONTROLLER_H
#define JOB_CONTROLLER_H

#include "controller/controller.h"
#include "api/cluster_client.h"
#include "plugins/plugin_registry.h"
#include "common/logger.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace volcano {

class JobController : public Controller {
private:
    std::shared_ptr<ClusterClient> cluster_;
    const plugins::PluginRegistry& registry_;
    std::shared_ptr<Logger> logger_;
    plugins::PluginClientset clientset_;
    int worker_threads_;
    std::chrono::milliseconds resync_period_;

    // Work queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;
    std::set<std::string> queued_;
    std::set<std::string> processing_;

    void enqueue(const std::string& key);
    bool next_key(std::string& key, const StopSignal& stop);
    void done(const std::string& key);

    void resync();
    void worker_loop(StopSignal stop);

    using PluginList = std::vector<std::unique_ptr<plugins::JobPlugin>>;

    void kill_job(Job& job, const PluginList& plugins);
    void initiate_job(Job& job, const PluginList& plugins);
    void create_missing_pods(const Job& job, const PluginList& plugins);
    void update_status(const Job& job);

    std::vector<Pod> pods_of(const Job& job);
    Pod build_pod(const Job& job, const TaskSpec& task, int index) const;

public:
    JobController(std::shared_ptr<ClusterClient> cluster,
                  const plugins::PluginRegistry& registry,
                  std::shared_ptr<Logger> logger,
                  int worker_threads,
                  std::chrono::milliseconds resync_period = std::chrono::seconds(1));

    std::string name() const override { return "job-controller"; }
    void run(const StopSignal& stop) override;

    // One reconcile pass for one job. Throws on failure.
    void sync_job(const std::string& namespace_name, const std::string& name);

    // Builds every plugin the job declares. Throws PluginError for unknown
    // names and invalid arguments.
    PluginList load_plugins(const Job& job) const;

    // Same as load_plugins but logs and skips plugins that fail to build,
    // so a job being deleted is always torn down.
    PluginList load_plugins_for_cleanup(const Job& job) const;
};

} // namespace volcano

#endif // JOB_CONTROLLER_H
