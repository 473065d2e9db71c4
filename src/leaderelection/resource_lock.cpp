/*******************************************************************************
    Project: Volcano Controller Manager

    File: resource_lock.cpp

    Description:
        Lock factory and candidate identity.
*******************************************************************************/

#include "leaderelection/resource_lock.h"
#include "leaderelection/file_lock.h"
#include "leaderelection/memory_lock.h"
#include "common/errors.h"

#include <uuid/uuid.h>
#include <unistd.h>        // gethostname()
#include <limits.h>        // HOST_NAME_MAX
#include <cerrno>
#include <cstring>

namespace volcano {
namespace leaderelection {

std::unique_ptr<ResourceLock> new_resource_lock(const ResourceLockConfig& config) {
    if (config.identity.empty()) {
        throw LockError("lock identity is empty");
    }
    if (config.name.empty()) {
        throw LockError("lock name is empty");
    }

    if (config.type == "memory") {
        if (!config.memory_store) {
            throw LockError("memory lock requires a lock store");
        }
        return std::make_unique<MemoryResourceLock>(config.memory_store, config.namespace_name,
                                                    config.name, config.identity);
    }
    if (config.type == "file") {
        return std::make_unique<FileResourceLock>(config.lock_dir, config.namespace_name,
                                                  config.name, config.identity);
    }
    throw LockError("invalid lock type \"" + config.type + "\"");
}

std::string make_lock_identity() {
    char hostname[HOST_NAME_MAX + 1];
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        throw LockError("unable to get hostname: " + std::string(strerror(errno)));
    }
    hostname[HOST_NAME_MAX] = '\0';

    char uuid_str[37];
    uuid_t uuid;
    uuid_generate(uuid);
    uuid_unparse(uuid, uuid_str);
    uuid_str[36] = '\0';

    return std::string(hostname) + "_" + uuid_str;
}

} // namespace leaderelection
} // namespace volcano
