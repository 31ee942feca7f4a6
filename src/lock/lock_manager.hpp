/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Lock Manager - Locks held by one store instance
 *
 * Two scopes:
 * - Resource locks (keyed by cache key) stay held until unlock() or
 *   release_all(); the owner must call release_all() before going away.
 * - Maintenance locks are taken and released around a single operation by
 *   run_exclusive(); failing to get one means another pass is running.
 */

#ifndef HTTPSTASH_LOCK_LOCK_MANAGER_HPP
#define HTTPSTASH_LOCK_LOCK_MANAGER_HPP

#include "lock/lock_backend.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace httpstash::lock {

class LockManager {
public:
    explicit LockManager(std::shared_ptr<LockBackend> backend);
    ~LockManager();

    // Non-copyable
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    /**
     * Acquire a resource lock
     *
     * @return false if this instance already holds @p name or the backend
     *         refused it
     */
    bool try_lock(const std::string& name);

    /**
     * Release a resource lock
     *
     * The local handle is forgotten even when the backend reports the lock as
     * already lost.
     *
     * @return false if no lock was held or the release itself failed
     */
    bool unlock(const std::string& name);

    /**
     * True iff this instance holds a granted handle for @p name
     */
    bool is_locked(const std::string& name) const;

    /**
     * Release every held resource lock, ignoring release failures
     */
    void release_all();

    std::size_t held_count() const;

    /**
     * Run @p operation while holding the maintenance lock @p name
     *
     * @return false if the lock was busy and @p operation did not run
     */
    bool run_exclusive(const std::string& name, const std::function<void()>& operation);

private:
    std::shared_ptr<LockBackend> backend_;
    std::unordered_map<std::string, std::unique_ptr<Lock>> locks_;
    mutable std::mutex mutex_;
};

} // namespace httpstash::lock

#endif // HTTPSTASH_LOCK_LOCK_MANAGER_HPP
