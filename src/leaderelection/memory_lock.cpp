/*******************************************************************************
    Project: Volcano Controller Manager

    File: memory_lock.cpp

    Description:
        In-process lock store with per-key compare-and-swap.
*******************************************************************************/

#include "leaderelection/memory_lock.h"
#include "common/errors.h"

namespace volcano {
namespace leaderelection {

std::optional<VersionedRecord> MemoryLockStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return VersionedRecord{it->second.record, std::to_string(it->second.version)};
}

void MemoryLockStore::create(const std::string& key, const LeaderElectionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(key)) {
        throw LockError("lock " + key + " already exists");
    }
    entries_[key] = Entry{record, 1};
}

void MemoryLockStore::update(const std::string& key, const LeaderElectionRecord& record,
                             const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw LockError("lock " + key + " not found");
    }
    if (std::to_string(it->second.version) != version) {
        throw LockError("lock " + key + " was modified (version " +
                        std::to_string(it->second.version) + ", expected " + version + ")");
    }
    it->second.record = record;
    it->second.version++;
}

MemoryResourceLock::MemoryResourceLock(std::shared_ptr<MemoryLockStore> store,
                                       const std::string& namespace_name,
                                       const std::string& name,
                                       const std::string& identity)
    : store_(std::move(store)),
      key_(namespace_name + "/" + name),
      identity_(identity) {
}

std::optional<VersionedRecord> MemoryResourceLock::get() {
    return store_->get(key_);
}

void MemoryResourceLock::create(const LeaderElectionRecord& record) {
    store_->create(key_, record);
}

void MemoryResourceLock::update(const LeaderElectionRecord& record, const std::string& version) {
    store_->update(key_, record, version);
}

} // namespace leaderelection
} // namespace volcano
