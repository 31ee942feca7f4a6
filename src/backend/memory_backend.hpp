/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Memory Backend - Thread-safe in-process key-value storage
 *
 * Features:
 * - Thread-safe with std::shared_mutex (concurrent reads, exclusive writes)
 * - Per-entry TTL checked on access and removed by prune()
 * - Tag invalidation
 * - Hit/miss statistics for monitoring
 */

#ifndef HTTPSTASH_BACKEND_MEMORY_BACKEND_HPP
#define HTTPSTASH_BACKEND_MEMORY_BACKEND_HPP

#include "backend/cache_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace httpstash::backend {

/**
 * Backend statistics for monitoring
 */
struct MemoryBackendStats {
    std::uint64_t hits{0};      // Total hits
    std::uint64_t misses{0};    // Total misses
    std::uint64_t expired{0};   // Total expired entries removed
    std::uint64_t prunes{0};    // Number of prune passes

    std::size_t entries{0};     // Committed entries
    std::size_t deferred{0};    // Entries waiting for commit()
};

class MemoryBackend : public CacheBackend {
public:
    explicit MemoryBackend(Capability capabilities = Capability::tags | Capability::prune);
    ~MemoryBackend() override = default;

    // Non-copyable, non-movable
    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    bool save_deferred(const std::string& key,
                       std::string value,
                       std::optional<std::chrono::seconds> ttl = std::nullopt,
                       const std::vector<std::string>& tags = {}) override;
    bool commit() override;
    bool remove(const std::string& key) override;
    bool clear() override;
    Capability capabilities() const override { return capabilities_; }
    bool invalidate_tags(const std::vector<std::string>& tags) override;
    bool prune() override;

    /**
     * Remaining lifetime of a stored value, nullopt if absent or unbounded
     */
    std::optional<std::chrono::seconds> ttl(const std::string& key) const;

    MemoryBackendStats get_stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expires_at;
        std::vector<std::string> tags;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    /**
     * Locate a live entry, deferred entries first
     * Must be called with a lock held
     */
    const Entry* find_entry(const std::string& key) const;

    static bool is_expired(const Entry& entry, Clock::time_point now);

    static bool has_any_tag(const Entry& entry, const std::vector<std::string>& tags);

    mutable std::shared_mutex mutex_;
    Capability capabilities_;

    EntryMap entries_;
    EntryMap deferred_;

    // Statistics (atomic for lock-free reads)
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::atomic<std::uint64_t> prunes_{0};
};

} // namespace httpstash::backend

#endif // HTTPSTASH_BACKEND_MEMORY_BACKEND_HPP
