/*******************************************************************************
    Project: Volcano Controller Manager

    File: file_lock.h

    Description:
        Lock backend for replicas that share a directory (hostPath or a
        shared volume). The record lives in "{dir}/{namespace}_{name}.lock"
        as key=value lines; a sibling ".guard" file is flock(2)ed around
        every read (shared) and every read-modify-write (exclusive).

        Record file:
            version=4
            holderIdentity=node-a_1b4e28ba-2fa1-11d2-883f-0016d3cca427
            leaseDurationMillis=15000
            acquireTimeMillis=1700000000000
            renewTimeMillis=1700000010000
            leaderTransitions=2

        Writes go to a temp file that is renamed over the record, so a
        crashed writer never leaves half a record behind.
*******************************************************************************/

#ifndef FILE_LOCK_H
#define FILE_LOCK_H

#include "leaderelection/resource_lock.h"

#include <cstdint>

namespace volcano {
namespace leaderelection {

class FileResourceLock : public ResourceLock {
private:
    std::string lock_dir_;
    std::string record_path_;
    std::string guard_path_;
    std::string key_;
    std::string identity_;

    std::optional<VersionedRecord> read_record() const;
    void write_record(const LeaderElectionRecord& record, uint64_t version) const;

public:
    // Creates lock_dir if needed. Throws LockError when it is unusable.
    FileResourceLock(const std::string& lock_dir, const std::string& namespace_name,
                     const std::string& name, const std::string& identity);

    std::optional<VersionedRecord> get() override;
    void create(const LeaderElectionRecord& record) override;
    void update(const LeaderElectionRecord& record, const std::string& version) override;

    std::string identity() const override { return identity_; }
    std::string describe() const override { return key_ + " (" + record_path_ + ")"; }

    const std::string& record_path() const { return record_path_; }
};

} // namespace leaderelection
} // namespace volcano

#endif // FILE_LOCK_H
