/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Lock Backend - Named, cross-instance mutual exclusion
 *
 * A backend hands out Lock handles by name. Whether two handles with the same
 * name exclude each other across processes or machines is up to the backend.
 */

#ifndef HTTPSTASH_LOCK_LOCK_BACKEND_HPP
#define HTTPSTASH_LOCK_LOCK_BACKEND_HPP

#include <memory>
#include <stdexcept>
#include <string>

namespace httpstash::lock {

/**
 * Raised by Lock::release() when the lock was no longer held
 * (expired, stolen or never acquired)
 */
class LockReleaseError : public std::runtime_error {
public:
    explicit LockReleaseError(const std::string& what) : std::runtime_error(what) {}
};

class Lock {
public:
    virtual ~Lock() = default;

    /**
     * Try to take the lock without waiting
     *
     * @return true if the lock is now held by this handle
     */
    virtual bool acquire() = 0;

    /**
     * @throws LockReleaseError if the lock is not held any more
     */
    virtual void release() = 0;

    virtual bool is_acquired() const = 0;

    virtual const std::string& name() const = 0;
};

class LockBackend {
public:
    virtual ~LockBackend() = default;

    /**
     * Create an unacquired handle for the named lock
     */
    virtual std::unique_ptr<Lock> create_lock(const std::string& name) = 0;
};

} // namespace httpstash::lock

#endif // HTTPSTASH_LOCK_LOCK_BACKEND_HPP
