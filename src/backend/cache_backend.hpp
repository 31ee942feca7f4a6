/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Cache Backend - Key-value storage the store is built on
 *
 * Values are opaque byte strings. Writes may be deferred and flushed in one
 * batch by commit(); deferred values are already visible to get().
 * Tag invalidation and pruning are optional capabilities, advertised once
 * through capabilities().
 */

#ifndef HTTPSTASH_BACKEND_CACHE_BACKEND_HPP
#define HTTPSTASH_BACKEND_CACHE_BACKEND_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace httpstash::backend {

/**
 * Optional backend features
 */
enum class Capability : std::uint32_t {
    none  = 0,
    tags  = 1u << 0,  // invalidate_tags() is supported
    prune = 1u << 1,  // prune() is supported
};

constexpr Capability operator|(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

constexpr bool has_capability(Capability set, Capability flag) {
    return (static_cast<std::uint32_t>(set) & static_cast<std::uint32_t>(flag)) != 0;
}

/**
 * Tags must be non-empty and free of the reserved characters {}()/\@:
 *
 * @throws std::invalid_argument otherwise
 */
inline void validate_tag(std::string_view tag) {
    if (tag.empty()) {
        throw std::invalid_argument("Cache tag must not be empty");
    }
    if (tag.find_first_of("{}()/\\@:") != std::string_view::npos) {
        throw std::invalid_argument("Cache tag contains reserved characters: " + std::string(tag));
    }
}

class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /**
     * @return the stored value, nullopt if absent, expired or tag-invalidated
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Queue a value for the next commit()
     *
     * @param ttl lifetime; nullopt stores without expiry
     * @param tags tags to attach (ignored by backends without Capability::tags)
     * @return false if the backend refused the value
     */
    virtual bool save_deferred(const std::string& key,
                               std::string value,
                               std::optional<std::chrono::seconds> ttl = std::nullopt,
                               const std::vector<std::string>& tags = {}) = 0;

    /**
     * Persist all deferred values
     *
     * @return false if any value failed to persist
     */
    virtual bool commit() = 0;

    /**
     * Delete a value (committed or deferred)
     *
     * @return true if a value existed
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * Drop everything, deferred values included
     */
    virtual bool clear() = 0;

    virtual Capability capabilities() const = 0;

    /**
     * Invalidate every value carrying any of the tags
     *
     * @throws std::invalid_argument on a malformed tag
     * @throws std::logic_error if the backend lacks Capability::tags
     */
    virtual bool invalidate_tags(const std::vector<std::string>& tags) {
        (void)tags;
        throw std::logic_error("Cache backend does not support tag invalidation");
    }

    /**
     * Remove expired values
     *
     * @throws std::logic_error if the backend lacks Capability::prune
     */
    virtual bool prune() {
        throw std::logic_error("Cache backend does not support pruning");
    }
};

} // namespace httpstash::backend

#endif // HTTPSTASH_BACKEND_CACHE_BACKEND_HPP
