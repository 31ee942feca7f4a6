/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Memory Backend Implementation
 */

#include "backend/memory_backend.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <mutex>

namespace httpstash::backend {

using util::log_component::Backend;

MemoryBackend::MemoryBackend(Capability capabilities)
    : capabilities_(capabilities) {
    HTTPSTASH_LOG_DEBUG(Backend, "Memory backend initialized: tags={}, prune={}",
                        has_capability(capabilities_, Capability::tags),
                        has_capability(capabilities_, Capability::prune));
}

std::optional<std::string> MemoryBackend::get(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> read_lock(mutex_);

        const Entry* entry = find_entry(key);
        if (entry == nullptr) {
            ++misses_;
            return std::nullopt;
        }

        if (!is_expired(*entry, Clock::now())) {
            ++hits_;
            return entry->value;
        }
    }

    // Expired: upgrade to exclusive lock and drop it
    std::unique_lock<std::shared_mutex> write_lock(mutex_);
    // Re-check after acquiring write lock (another thread may have replaced it)
    auto it = entries_.find(key);
    if (it != entries_.end() && is_expired(it->second, Clock::now())) {
        entries_.erase(it);
        ++expired_;
    }
    ++misses_;
    return std::nullopt;
}

bool MemoryBackend::save_deferred(const std::string& key,
                                  std::string value,
                                  std::optional<std::chrono::seconds> ttl,
                                  const std::vector<std::string>& tags) {
    Entry entry;
    entry.value = std::move(value);
    if (ttl) {
        // Saturate instead of overflowing the clock's representation
        auto now = Clock::now();
        auto limit = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
        entry.expires_at = now + std::clamp(*ttl, std::chrono::seconds::zero(), limit);
    }
    if (has_capability(capabilities_, Capability::tags)) {
        entry.tags = tags;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    deferred_[key] = std::move(entry);
    return true;
}

bool MemoryBackend::commit() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (auto& [key, entry] : deferred_) {
        entries_[key] = std::move(entry);
    }
    deferred_.clear();
    return true;
}

bool MemoryBackend::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    bool existed = entries_.erase(key) > 0;
    existed = deferred_.erase(key) > 0 || existed;

    if (existed) {
        HTTPSTASH_LOG_TRACE(Backend, "Memory entry removed: key={}", key);
    }
    return existed;
}

bool MemoryBackend::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = entries_.size() + deferred_.size();
    entries_.clear();
    deferred_.clear();

    HTTPSTASH_LOG_DEBUG(Backend, "Memory backend cleared: {} entries removed", count);
    return true;
}

bool MemoryBackend::invalidate_tags(const std::vector<std::string>& tags) {
    if (!has_capability(capabilities_, Capability::tags)) {
        return CacheBackend::invalidate_tags(tags);
    }
    for (const auto& tag : tags) {
        validate_tag(tag);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t removed = 0;
    for (auto* map : {&entries_, &deferred_}) {
        removed += std::erase_if(*map, [&tags](const auto& item) {
            return has_any_tag(item.second, tags);
        });
    }

    HTTPSTASH_LOG_DEBUG(Backend, "Tag invalidation removed {} entries", removed);
    return true;
}

bool MemoryBackend::prune() {
    if (!has_capability(capabilities_, Capability::prune)) {
        return CacheBackend::prune();
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto now = Clock::now();
    auto removed = std::erase_if(entries_, [now](const auto& item) {
        return is_expired(item.second, now);
    });
    expired_ += removed;
    ++prunes_;

    HTTPSTASH_LOG_DEBUG(Backend, "Memory backend pruned: {} expired entries removed", removed);
    return true;
}

std::optional<std::chrono::seconds> MemoryBackend::ttl(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const Entry* entry = find_entry(key);
    if (entry == nullptr || !entry->expires_at) {
        return std::nullopt;
    }
    auto remaining = *entry->expires_at - Clock::now();
    return std::chrono::ceil<std::chrono::seconds>(std::max(remaining, Clock::duration::zero()));
}

MemoryBackendStats MemoryBackend::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    MemoryBackendStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.expired = expired_.load();
    stats.prunes = prunes_.load();
    stats.entries = entries_.size();
    stats.deferred = deferred_.size();

    return stats;
}

const MemoryBackend::Entry* MemoryBackend::find_entry(const std::string& key) const {
    if (auto it = deferred_.find(key); it != deferred_.end()) {
        return &it->second;
    }
    if (auto it = entries_.find(key); it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool MemoryBackend::is_expired(const Entry& entry, Clock::time_point now) {
    return entry.expires_at && now >= *entry.expires_at;
}

bool MemoryBackend::has_any_tag(const Entry& entry, const std::vector<std::string>& tags) {
    return std::any_of(entry.tags.begin(), entry.tags.end(), [&tags](const std::string& tag) {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    });
}

} // namespace httpstash::backend
