/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Lock Manager Implementation
 */

#include "lock/lock_manager.hpp"

#include "util/logger.hpp"

namespace httpstash::lock {

namespace log_component = util::log_component;

LockManager::LockManager(std::shared_ptr<LockBackend> backend)
    : backend_(std::move(backend)) {
}

LockManager::~LockManager() {
    // No implicit release: the owner is expected to call release_all()
    if (!locks_.empty()) {
        HTTPSTASH_LOG_WARN(log_component::Lock, "{} locks still held at teardown", locks_.size());
    }
}

bool LockManager::try_lock(const std::string& name) {
    std::lock_guard<std::mutex> guard(mutex_);

    if (locks_.count(name) > 0) {
        return false;
    }

    auto lock = backend_->create_lock(name);
    if (!lock->acquire()) {
        HTTPSTASH_LOG_DEBUG(log_component::Lock, "Lock busy: {}", name);
        return false;
    }

    locks_.emplace(name, std::move(lock));
    HTTPSTASH_LOG_DEBUG(log_component::Lock, "Lock acquired: {}", name);
    return true;
}

bool LockManager::unlock(const std::string& name) {
    std::unique_ptr<Lock> lock;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = locks_.find(name);
        if (it == locks_.end()) {
            return false;
        }
        lock = std::move(it->second);
        locks_.erase(it);
    }

    try {
        lock->release();
    } catch (const LockReleaseError& e) {
        HTTPSTASH_LOG_INFO(log_component::Lock, "Lock {} was already lost: {}", name, e.what());
        return false;
    }

    HTTPSTASH_LOG_DEBUG(log_component::Lock, "Lock released: {}", name);
    return true;
}

bool LockManager::is_locked(const std::string& name) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = locks_.find(name);
    return it != locks_.end() && it->second->is_acquired();
}

void LockManager::release_all() {
    std::unordered_map<std::string, std::unique_ptr<Lock>> held;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        held.swap(locks_);
    }

    for (auto& [name, lock] : held) {
        try {
            lock->release();
        } catch (const LockReleaseError& e) {
            HTTPSTASH_LOG_DEBUG(log_component::Lock, "Ignoring release failure for {}: {}", name, e.what());
        }
    }
}

std::size_t LockManager::held_count() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return locks_.size();
}

bool LockManager::run_exclusive(const std::string& name, const std::function<void()>& operation) {
    auto lock = backend_->create_lock(name);
    if (!lock->acquire()) {
        HTTPSTASH_LOG_DEBUG(log_component::Lock, "Skipping {}: another pass is in progress", name);
        return false;
    }

    auto release = [&lock, &name]() {
        try {
            lock->release();
        } catch (const LockReleaseError& e) {
            HTTPSTASH_LOG_WARN(log_component::Lock, "Maintenance lock {} was lost: {}", name, e.what());
        }
    };

    try {
        operation();
    } catch (...) {
        release();
        throw;
    }
    release();
    return true;
}

} // namespace httpstash::lock
