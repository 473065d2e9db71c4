/*******************************************************************************
    Project: Volcano Controller Manager

    File: file_lock.cpp

    Description:
        File-backed ResourceLock. Readers take a shared flock on the guard
        file, writers an exclusive one. Records are written to a temporary
        file and renamed into place so readers never see a partial record.
*******************************************************************************/

#include "leaderelection/file_lock.h"
#include "common/errors.h"

#include <sys/file.h>      // flock()
#include <sys/stat.h>      // stat(), mkdir()
#include <fcntl.h>         // open()
#include <unistd.h>        // close()
#include <cerrno>
#include <cstdio>          // std::rename()
#include <cstring>
#include <fstream>
#include <map>

namespace volcano {
namespace leaderelection {

namespace {

// Holds flock(2) on a guard file for the lifetime of the object.
class FlockGuard {
private:
    int fd_;

public:
    FlockGuard(const std::string& path, int operation) : fd_(-1) {
        fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw LockError("cannot open " + path + ": " + strerror(errno));
        }
        int rc;
        do {
            rc = flock(fd_, operation);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int saved = errno;
            close(fd_);
            throw LockError("cannot flock " + path + ": " + strerror(saved));
        }
    }

    ~FlockGuard() {
        flock(fd_, LOCK_UN);
        close(fd_);
    }

    FlockGuard(const FlockGuard&) = delete;
    FlockGuard& operator=(const FlockGuard&) = delete;
};

int64_t to_millis(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // anonymous namespace

FileResourceLock::FileResourceLock(const std::string& lock_dir,
                                   const std::string& namespace_name,
                                   const std::string& name,
                                   const std::string& identity)
    : lock_dir_(lock_dir),
      key_(namespace_name + "/" + name),
      identity_(identity) {
    if (lock_dir_.empty()) {
        throw LockError("lock directory is empty");
    }

    struct stat st;
    if (stat(lock_dir_.c_str(), &st) != 0) {
        if (mkdir(lock_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
            throw LockError("cannot create lock directory " + lock_dir_ + ": " + strerror(errno));
        }
    } else if (!S_ISDIR(st.st_mode)) {
        throw LockError(lock_dir_ + " is not a directory");
    }

    std::string base = lock_dir_ + "/" + namespace_name + "_" + name;
    record_path_ = base + ".lock";
    guard_path_ = base + ".guard";
}

std::optional<VersionedRecord> FileResourceLock::read_record() const {
    std::ifstream file(record_path_);
    if (!file.is_open()) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw LockError("cannot read " + record_path_ + ": " + strerror(errno));
    }

    std::map<std::string, std::string> fields;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw LockError("malformed line in " + record_path_ + ": " + line);
        }
        fields[line.substr(0, eq)] = line.substr(eq + 1);
    }

    if (fields.empty()) {
        return std::nullopt;
    }

    VersionedRecord result;
    try {
        result.version = fields.at("version");
        result.record.holder_identity = fields["holderIdentity"];
        result.record.lease_duration =
            std::chrono::milliseconds(std::stoll(fields.at("leaseDurationMillis")));
        result.record.acquire_time = from_millis(std::stoll(fields.at("acquireTimeMillis")));
        result.record.renew_time = from_millis(std::stoll(fields.at("renewTimeMillis")));
        result.record.leader_transitions = std::stoi(fields.at("leaderTransitions"));
    } catch (const std::logic_error& e) {
        // std::out_of_range from at(), std::invalid_argument from stoll()
        throw LockError("malformed record in " + record_path_ + ": " + e.what());
    }
    return result;
}

void FileResourceLock::write_record(const LeaderElectionRecord& record, uint64_t version) const {
    std::string tmp_path = record_path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw LockError("cannot write " + tmp_path + ": " + strerror(errno));
        }
        file << "version=" << version << "\n"
             << "holderIdentity=" << record.holder_identity << "\n"
             << "leaseDurationMillis=" << record.lease_duration.count() << "\n"
             << "acquireTimeMillis=" << to_millis(record.acquire_time) << "\n"
             << "renewTimeMillis=" << to_millis(record.renew_time) << "\n"
             << "leaderTransitions=" << record.leader_transitions << "\n";
        file.flush();
        if (!file) {
            throw LockError("short write to " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), record_path_.c_str()) != 0) {
        throw LockError("cannot replace " + record_path_ + ": " + strerror(errno));
    }
}

std::optional<VersionedRecord> FileResourceLock::get() {
    FlockGuard guard(guard_path_, LOCK_SH);
    return read_record();
}

void FileResourceLock::create(const LeaderElectionRecord& record) {
    FlockGuard guard(guard_path_, LOCK_EX);
    if (read_record()) {
        throw LockError("lock " + key_ + " already exists");
    }
    write_record(record, 1);
}

void FileResourceLock::update(const LeaderElectionRecord& record, const std::string& version) {
    FlockGuard guard(guard_path_, LOCK_EX);

    auto current = read_record();
    if (!current) {
        throw LockError("lock " + key_ + " not found");
    }
    if (current->version != version) {
        throw LockError("lock " + key_ + " was modified (version " + current->version +
                        ", expected " + version + ")");
    }

    uint64_t next;
    try {
        next = std::stoull(current->version) + 1;
    } catch (const std::logic_error&) {
        throw LockError("malformed version in " + record_path_ + ": " + current->version);
    }
    write_record(record, next);
}

} // namespace leaderelection
} // namespace volcano
