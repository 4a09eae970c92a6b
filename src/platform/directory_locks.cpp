#include "safeproc/directory_locks.hpp"

#include <filesystem>
#include <utility>
#include <system_error>

namespace safeproc {

namespace fs = std::filesystem;

namespace {

// "dir", "./dir" and "/abs/dir/" must map to the same key
std::string lock_key(const std::string& directory) {
    std::error_code ec;
    auto abs = fs::absolute(directory, ec);
    if (ec) return directory;
    auto canon = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal().string();
    std::string key = canon.lexically_normal().string();
    while (key.size() > 1 && key.back() == '/') {
        key.pop_back();
    }
    return key;
}

} // namespace

DirectoryLocks::Lock::Lock(std::shared_ptr<std::mutex> mutex)
    : mutex_(std::move(mutex)), lock_(*mutex_) {}

DirectoryLocks::Lock DirectoryLocks::acquire(const std::string& directory) {
    std::shared_ptr<std::mutex> dir_mutex;
    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        prune_idle();
        auto& slot = locks_[lock_key(directory)];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        dir_mutex = slot;
    }
    return Lock(std::move(dir_mutex));
}

// Caller holds registry_mutex_. References are only copied under it, so a
// use count of one means no Lock holds or waits for the entry.
void DirectoryLocks::prune_idle() {
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.use_count() == 1) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t DirectoryLocks::size() {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    prune_idle();
    return locks_.size();
}

} // namespace safeproc
