/*******************************************************************************
    Project: Volcano Controller Manager

    File: ssh_plugin.h

    Description:
        Job plugin that gives every pod of a job password-less SSH access to
        its siblings.

        on_job_add     generates a CredentialBundle, stores it as the secret
                       "{job}-{uid}-ssh" and sets the "plugin-ssh" marker.
                       Does nothing once the marker is set.
        on_pod_create  adds one secret volume and mounts it in every
                       container at the configured path.
        on_job_delete  deletes the secret (an absent secret is fine).

        Options (plugin arguments):
            --no-root               mount under /etc/volcano/.ssh instead of
                                    /root/.ssh (for non-root users)
            --ssh-key-file-path P   explicit mount path
        Any mount path other than /root/.ssh gets mode 0755 instead of 0600.
*******************************************************************************/

#ifndef SSH_PLUGIN_H
#define SSH_PLUGIN_H

#include "plugins/plugin_interface.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace volcano {
namespace plugins {

constexpr const char* kSshPrivateKey = "id_rsa";
constexpr const char* kSshPublicKey = "id_rsa.pub";
constexpr const char* kSshAuthorizedKeys = "authorized_keys";
constexpr const char* kSshConfig = "config";
constexpr const char* kSshAbsolutePath = "/root/.ssh";
constexpr const char* kSshRelativePath = ".ssh";
constexpr const char* kConfigMapMountPath = "/etc/volcano";

constexpr int32_t kSshDefaultMode = 0600;
constexpr int32_t kSshNoRootMode = 0755;

struct SshPluginConfig {
    bool no_root;
    std::string ssh_key_file_path;

    SshPluginConfig() : no_root(false), ssh_key_file_path(kSshAbsolutePath) {}

    // Throws PluginError for unknown flags or malformed values.
    static SshPluginConfig parse(const std::vector<std::string>& arguments);

    int32_t volume_mode() const;
};

class SshPlugin : public JobPlugin {
private:
    PluginClientset clientset_;
    std::shared_ptr<Logger> logger_;
    SshPluginConfig config_;

    std::string secret_name(const Job& job) const;
    void mount_rsa_key(Pod& pod, const Job& job) const;
    void create_secret(const Job& job, const std::map<std::string, std::string>& data);

public:
    static constexpr const char* kName = "ssh";

    SshPlugin(const PluginClientset& clientset, const SshPluginConfig& config);

    static std::unique_ptr<JobPlugin> create(const PluginClientset& clientset,
                                             const std::vector<std::string>& arguments);

    const SshPluginConfig& config() const { return config_; }

    std::string name() const override { return kName; }

    void on_pod_create(Pod& pod, const Job& job) override;
    void on_job_add(Job& job) override;
    void on_job_delete(Job& job) override;
};

} // namespace plugins
} // namespace volcano

#endif // SSH_PLUGIN_H
