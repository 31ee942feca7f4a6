/**
 * HTTPSTASH - Shared HTTP Cache Store
 * File Lock Backend - Advisory file locks shared between processes
 *
 * One lock file per name under <directory>/locks/. Cross-process exclusion
 * comes from boost::interprocess::file_lock; a process-wide registry adds
 * exclusion between handles living in the same process, which advisory
 * record locks do not provide on their own.
 *
 * The operating system drops a lock when its holder exits, so a crashed
 * process never leaves a name locked.
 */

#ifndef HTTPSTASH_LOCK_FILE_LOCK_BACKEND_HPP
#define HTTPSTASH_LOCK_FILE_LOCK_BACKEND_HPP

#include "lock/lock_backend.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace httpstash::lock {

class FileLockBackend : public LockBackend {
public:
    /**
     * @throws httpstash::ConfigError if the lock directory cannot be created
     */
    explicit FileLockBackend(const std::filesystem::path& directory);

    std::unique_ptr<Lock> create_lock(const std::string& name) override;

    /**
     * Path of the lock file used for a name
     */
    std::filesystem::path lock_path(const std::string& name) const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    class FileLock;

    std::filesystem::path directory_;
};

} // namespace httpstash::lock

#endif // HTTPSTASH_LOCK_FILE_LOCK_BACKEND_HPP
