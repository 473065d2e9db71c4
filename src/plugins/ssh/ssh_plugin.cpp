/*******************************************************************************
    Project: Volcano Controller Manager

    File: ssh_plugin.cpp

    Description:
        ssh job plugin: stores the credential bundle as a secret and mounts
        it into every container of every pod of the job.
*******************************************************************************/

#include "plugins/ssh/ssh_plugin.h"
#include "plugins/plugin_arguments.h"
#include "plugins/ssh/credential_bundle.h"
#include "common/errors.h"

namespace volcano {
namespace plugins {

//==============================================================================
// Options
//==============================================================================

SshPluginConfig SshPluginConfig::parse(const std::vector<std::string>& arguments) {
    SshPluginConfig config;

    PluginArguments flags(SshPlugin::kName);
    flags.add_bool("no-root", &config.no_root);
    flags.add_string("ssh-key-file-path", &config.ssh_key_file_path);
    flags.parse(arguments);

    // --no-root only moves the mount when no explicit path was given.
    if (config.no_root && config.ssh_key_file_path == kSshAbsolutePath) {
        config.ssh_key_file_path = std::string(kConfigMapMountPath) + "/" + kSshRelativePath;
    }
    if (config.ssh_key_file_path.empty()) {
        throw PluginError("plugin ssh: ssh-key-file-path must not be empty");
    }
    return config;
}

int32_t SshPluginConfig::volume_mode() const {
    return ssh_key_file_path == kSshAbsolutePath ? kSshDefaultMode : kSshNoRootMode;
}

//==============================================================================
// Plugin
//==============================================================================

SshPlugin::SshPlugin(const PluginClientset& clientset, const SshPluginConfig& config)
    : clientset_(clientset),
      logger_(clientset.logger ? clientset.logger->with_component("ssh-plugin")
                               : std::make_shared<Logger>()),
      config_(config) {
}

std::unique_ptr<JobPlugin> SshPlugin::create(const PluginClientset& clientset,
                                             const std::vector<std::string>& arguments) {
    return std::make_unique<SshPlugin>(clientset, SshPluginConfig::parse(arguments));
}

std::string SshPlugin::secret_name(const Job& job) const {
    return credential_bundle_name(job.name, job.uid, name());
}

void SshPlugin::on_pod_create(Pod& pod, const Job& job) {
    mount_rsa_key(pod, job);
}

void SshPlugin::on_job_add(Job& job) {
    if (is_plugin_applied(job, name())) {
        return;
    }

    CredentialBundle bundle;
    try {
        bundle = generate_credential_bundle(job);
    } catch (const PluginError& e) {
        logger_->error("credential generation for job <" + job_key(job) + "> failed: " + e.what());
        throw;
    }

    std::map<std::string, std::string> data;
    data[kSshPrivateKey] = bundle.private_key_pem;
    data[kSshPublicKey] = bundle.public_key_authorized;
    data[kSshConfig] = bundle.config_text;

    try {
        create_secret(job, data);
    } catch (const std::exception& e) {
        throw PluginError("create secret for job <" + job_key(job) +
                          "> with ssh plugin failed for " + e.what());
    }

    mark_plugin_applied(job, name());
}

void SshPlugin::on_job_delete(Job& job) {
    clientset_.cluster->delete_secret(job.namespace_name, secret_name(job));
}

void SshPlugin::create_secret(const Job& job, const std::map<std::string, std::string>& data) {
    Secret secret;
    secret.name = secret_name(job);
    secret.namespace_name = job.namespace_name;
    secret.owner_uid = job.uid;
    secret.data = data;

    try {
        clientset_.cluster->create_secret(secret);
        logger_->info("created secret " + secret.name + " for job <" + job_key(job) + ">");
    } catch (const ApiError& e) {
        if (!is_already_exists(e)) throw;
        // Left over from an attempt whose status update failed; keep it.
        logger_->info("secret " + secret.name + " already exists, reusing it");
    }
}

void SshPlugin::mount_rsa_key(Pod& pod, const Job& job) const {
    std::string secret = secret_name(job);
    std::string relative = kSshRelativePath;

    Volume ssh_volume;
    ssh_volume.name = secret;

    SecretVolumeSource source;
    source.secret_name = secret;
    source.items = {
        {kSshPrivateKey, relative + "/" + kSshPrivateKey},
        {kSshPublicKey, relative + "/" + kSshPublicKey},
        {kSshPublicKey, relative + "/" + kSshAuthorizedKeys},
        {kSshConfig, relative + "/" + kSshConfig},
    };
    source.default_mode = config_.volume_mode();
    ssh_volume.secret = source;

    pod.spec.volumes.push_back(ssh_volume);

    for (auto& container : pod.spec.containers) {
        VolumeMount mount;
        mount.name = secret;
        mount.mount_path = config_.ssh_key_file_path;
        mount.sub_path = relative;
        container.volume_mounts.push_back(mount);
    }
}

} // namespace plugins
} // namespace volcano
