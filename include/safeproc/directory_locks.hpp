#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace safeproc {

/**
 * @brief One mutex per directory, keyed by canonical path
 *
 * Work that touches shared files inside a directory (auxiliary and output
 * files of a multi-pass compile) holds the directory's lock for the whole
 * sequence. Share one registry between every caller that must be
 * serialized. An entry lives while some Lock holds or waits for it; idle
 * entries are dropped by the next acquire() or size().
 */
class DirectoryLocks {
public:
    // Held lock on one directory; releases on destruction.
    class Lock {
    public:
        Lock() = default;
        Lock(Lock&&) = default;
        Lock& operator=(Lock&& other) noexcept {
            lock_ = std::move(other.lock_);      // unlocks ours while its mutex is alive
            mutex_ = std::move(other.mutex_);
            return *this;
        }

        bool owns_lock() const { return lock_.owns_lock(); }

    private:
        friend class DirectoryLocks;
        explicit Lock(std::shared_ptr<std::mutex> mutex);

        std::shared_ptr<std::mutex> mutex_;   // declared first: outlives lock_
        std::unique_lock<std::mutex> lock_;
    };

    DirectoryLocks() = default;
    DirectoryLocks(const DirectoryLocks&) = delete;
    DirectoryLocks& operator=(const DirectoryLocks&) = delete;

    // Blocks until the lock for @p directory is held.
    Lock acquire(const std::string& directory);

    // Number of directories currently held or waited for; drops idle entries
    size_t size();

private:
    void prune_idle();

    std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace safeproc
