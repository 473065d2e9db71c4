/*******************************************************************************
    Project: Volcano Controller Manager

    File: memory_lock.h

    Description:
        In-process lock backend. Several MemoryResourceLocks sharing one
        MemoryLockStore behave like replicas sharing one API server: each
        write is a compare-and-swap on a per-key version counter.
*******************************************************************************/

#ifndef MEMORY_LOCK_H
#define MEMORY_LOCK_H

#include "leaderelection/resource_lock.h"

#include <cstdint>
#include <map>
#include <mutex>

namespace volcano {
namespace leaderelection {

class MemoryLockStore {
private:
    struct Entry {
        LeaderElectionRecord record;
        uint64_t version;
    };

    std::mutex mutex_;
    std::map<std::string, Entry> entries_;

public:
    std::optional<VersionedRecord> get(const std::string& key);
    void create(const std::string& key, const LeaderElectionRecord& record);
    void update(const std::string& key, const LeaderElectionRecord& record, const std::string& version);
};

class MemoryResourceLock : public ResourceLock {
private:
    std::shared_ptr<MemoryLockStore> store_;
    std::string key_;
    std::string identity_;

public:
    MemoryResourceLock(std::shared_ptr<MemoryLockStore> store, const std::string& namespace_name,
                       const std::string& name, const std::string& identity);

    std::optional<VersionedRecord> get() override;
    void create(const LeaderElectionRecord& record) override;
    void update(const LeaderElectionRecord& record, const std::string& version) override;

    std::string identity() const override { return identity_; }
    std::string describe() const override { return key_; }
};

} // namespace leaderelection
} // namespace volcano

#endif // MEMORY_LOCK_H
