/**
 * HTTPSTASH - Shared HTTP Cache Store
 * File Lock Backend Implementation
 */

#include "lock/file_lock_backend.hpp"

#include "cache/cache_key.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>

#include <cctype>
#include <fstream>
#include <mutex>
#include <system_error>
#include <unordered_set>

namespace httpstash::lock {

namespace fs = std::filesystem;
namespace ipc = boost::interprocess;
namespace log_component = util::log_component;

namespace {

/**
 * Lock files currently held by any handle in this process
 */
class ProcessRegistry {
public:
    static ProcessRegistry& instance() {
        static ProcessRegistry registry;
        return registry;
    }

    bool claim(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return claimed_.insert(path).second;
    }

    void unclaim(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        claimed_.erase(path);
    }

private:
    std::mutex mutex_;
    std::unordered_set<std::string> claimed_;
};

} // namespace

class FileLockBackend::FileLock : public lock::Lock {
public:
    FileLock(std::string name, fs::path path)
        : name_(std::move(name))
        , path_(std::move(path)) {
    }

    ~FileLock() override {
        // Closing the file drops the OS lock; forget the in-process claim too
        if (acquired_) {
            close();
            ProcessRegistry::instance().unclaim(path_.string());
        }
    }

    bool acquire() override {
        if (acquired_) {
            return true;
        }
        if (!ProcessRegistry::instance().claim(path_.string())) {
            return false;
        }

        try {
            // file_lock requires an existing file
            std::ofstream touch(path_, std::ios::app);
            file_lock_ = ipc::file_lock(path_.c_str());
            acquired_ = file_lock_.try_lock();
        } catch (const ipc::interprocess_exception& e) {
            HTTPSTASH_LOG_WARN(log_component::Lock, "Cannot lock {}: {}", path_.string(), e.what());
            acquired_ = false;
        }

        if (!acquired_) {
            close();
            ProcessRegistry::instance().unclaim(path_.string());
        }
        return acquired_;
    }

    void release() override {
        if (!acquired_) {
            throw LockReleaseError("Lock \"" + name_ + "\" is not acquired");
        }
        acquired_ = false;

        std::string error;
        try {
            file_lock_.unlock();
        } catch (const ipc::interprocess_exception& e) {
            error = e.what();
        }
        close();
        ProcessRegistry::instance().unclaim(path_.string());

        if (!error.empty()) {
            throw LockReleaseError("Failed to release lock \"" + name_ + "\": " + error);
        }
    }

    bool is_acquired() const override { return acquired_; }

    const std::string& name() const override { return name_; }

private:
    // Record locks belong to the process: any descriptor closed on the file
    // drops them, so close ours before another handle may claim the path
    void close() {
        file_lock_ = ipc::file_lock();
    }

    std::string name_;
    fs::path path_;
    ipc::file_lock file_lock_;
    bool acquired_{false};
};

FileLockBackend::FileLockBackend(const fs::path& directory)
    : directory_(directory / "locks") {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw ConfigError("Cannot create lock directory " + directory_.string() + ": " + ec.message());
    }
}

std::unique_ptr<Lock> FileLockBackend::create_lock(const std::string& name) {
    return std::make_unique<FileLock>(name, lock_path(name));
}

fs::path FileLockBackend::lock_path(const std::string& name) const {
    // Readable prefix plus a hash so sanitized names cannot collide
    std::string readable;
    for (char c : name.substr(0, 64)) {
        auto uc = static_cast<unsigned char>(c);
        readable.push_back(std::isalnum(uc) || c == '.' || c == '_' || c == '-' ? c : '-');
    }
    return directory_ / (readable + "." + cache::hash_hex(name).substr(0, 12) + ".lock");
}

} // namespace httpstash::lock
