/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Memory Lock Backend Implementation
 */

#include "lock/memory_lock_backend.hpp"

namespace httpstash::lock {

class MemoryLockBackend::MemoryLock : public Lock {
public:
    MemoryLock(std::string name, std::shared_ptr<State> state)
        : name_(std::move(name))
        , state_(std::move(state)) {
    }

    ~MemoryLock() override {
        if (!acquired_) {
            return;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->held.find(name_);
        if (it != state_->held.end() && it->second == this) {
            state_->held.erase(it);
        }
    }

    bool acquire() override {
        if (acquired_) {
            return true;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        acquired_ = state_->held.emplace(name_, this).second;
        return acquired_;
    }

    void release() override {
        if (!acquired_) {
            throw LockReleaseError("Lock \"" + name_ + "\" is not acquired");
        }
        acquired_ = false;

        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->held.find(name_);
        if (it == state_->held.end() || it->second != this) {
            throw LockReleaseError("Lock \"" + name_ + "\" expired before release");
        }
        state_->held.erase(it);
    }

    bool is_acquired() const override {
        if (!acquired_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->held.find(name_);
        return it != state_->held.end() && it->second == this;
    }

    const std::string& name() const override { return name_; }

private:
    std::string name_;
    std::shared_ptr<State> state_;
    bool acquired_{false};
};

MemoryLockBackend::MemoryLockBackend()
    : state_(std::make_shared<State>()) {
}

std::unique_ptr<Lock> MemoryLockBackend::create_lock(const std::string& name) {
    return std::make_unique<MemoryLock>(name, state_);
}

bool MemoryLockBackend::expire(const std::string& name) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->held.erase(name) > 0;
}

bool MemoryLockBackend::is_held(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->held.count(name) > 0;
}

} // namespace httpstash::lock
