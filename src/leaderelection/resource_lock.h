/*******************************************************************************
    Project: Volcano Controller Manager

    File: resource_lock.h

    Description:
        The coordination object controller replicas compete for. A lock
        stores one LeaderElectionRecord and hands out an opaque version with
        every read; writes carry the version they are based on and fail when
        somebody else wrote in between. That compare-and-swap is the only
        mutual exclusion the elector relies on.

        Backends:
            memory  MemoryResourceLock over a shared MemoryLockStore
                    (replicas inside one process, simulations, tests)
            file    FileResourceLock, one record file per lock in a shared
                    directory guarded by flock(2)
*******************************************************************************/

#ifndef RESOURCE_LOCK_H
#define RESOURCE_LOCK_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace volcano {
namespace leaderelection {

struct LeaderElectionRecord {
    std::string holder_identity;          // empty when released
    std::chrono::milliseconds lease_duration;
    std::chrono::system_clock::time_point acquire_time;
    std::chrono::system_clock::time_point renew_time;
    int leader_transitions;

    LeaderElectionRecord() : lease_duration(0), leader_transitions(0) {}

    bool operator==(const LeaderElectionRecord& other) const {
        return holder_identity == other.holder_identity &&
               lease_duration == other.lease_duration &&
               acquire_time == other.acquire_time &&
               renew_time == other.renew_time &&
               leader_transitions == other.leader_transitions;
    }
    bool operator!=(const LeaderElectionRecord& other) const { return !(*this == other); }
};

struct VersionedRecord {
    LeaderElectionRecord record;
    std::string version;
};

class ResourceLock {
public:
    virtual ~ResourceLock() = default;

    // nullopt when the lock object does not exist yet. Throws LockError.
    virtual std::optional<VersionedRecord> get() = 0;

    // Throws LockError if the object already exists.
    virtual void create(const LeaderElectionRecord& record) = 0;

    // Throws LockError if `version` is no longer current.
    virtual void update(const LeaderElectionRecord& record, const std::string& version) = 0;

    virtual std::string identity() const = 0;
    virtual std::string describe() const = 0;
};

class MemoryLockStore;

struct ResourceLockConfig {
    std::string type;                               // "file" or "memory"
    std::string namespace_name;
    std::string name;
    std::string identity;
    std::string lock_dir;                           // file backend
    std::shared_ptr<MemoryLockStore> memory_store;  // memory backend
};

// Throws LockError describing the first broken precondition.
std::unique_ptr<ResourceLock> new_resource_lock(const ResourceLockConfig& config);

// "{hostname}_{uuid}", so two processes on one host never share an identity.
// Throws LockError when the hostname cannot be read.
std::string make_lock_identity();

} // namespace leaderelection
} // namespace volcano

#endif // RESOURCE_LOCK_H
