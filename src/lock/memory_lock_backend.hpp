/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Memory Lock Backend - Process-local named locks
 *
 * Handles from one backend instance exclude each other; share the backend
 * between store instances to serialize them within a process.
 */

#ifndef HTTPSTASH_LOCK_MEMORY_LOCK_BACKEND_HPP
#define HTTPSTASH_LOCK_MEMORY_LOCK_BACKEND_HPP

#include "lock/lock_backend.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace httpstash::lock {

class MemoryLockBackend : public LockBackend {
public:
    MemoryLockBackend();

    std::unique_ptr<Lock> create_lock(const std::string& name) override;

    /**
     * Drop a held lock as if it had timed out. The owning handle's next
     * release() fails with LockReleaseError.
     *
     * @return true if the lock was held
     */
    bool expire(const std::string& name);

    bool is_held(const std::string& name) const;

private:
    struct State {
        mutable std::mutex mutex;
        std::unordered_map<std::string, const void*> held;  // Name -> owning handle
    };

    class MemoryLock;

    std::shared_ptr<State> state_;
};

} // namespace httpstash::lock

#endif // HTTPSTASH_LOCK_MEMORY_LOCK_BACKEND_HPP
