/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Store - Metadata store the HTTP caching engine talks to
 *
 * A URL maps to a metadata entry holding one record per Vary variant.
 * Bodies live in the content store, shared by digest. Responses without a
 * Vary header are stored under the "non-varying" key, which is dropped as
 * soon as a varying response is written for the same URL.
 *
 * Per-resource locks taken with lock() belong to this instance; the owner
 * must call cleanup() before discarding it.
 */

#ifndef HTTPSTASH_STORE_STORE_HPP
#define HTTPSTASH_STORE_STORE_HPP

#include "backend/cache_backend.hpp"
#include "config/config.hpp"
#include "http/message.hpp"
#include "lock/lock_backend.hpp"
#include "lock/lock_manager.hpp"
#include "store/content_store.hpp"
#include "store/entry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpstash::store {

inline constexpr std::string_view kCounterKey = "write-operations-counter";
inline constexpr std::string_view kPruneLockName = "prune-lock";
inline constexpr std::string_view kCleanupLockName = "cleanup-lock";

/**
 * Store construction options
 *
 * An explicit backend takes precedence over cache_directory; the directory
 * is only used to build the defaults (filesystem cache, file locks).
 */
struct StoreOptions {
    std::string cache_directory;
    std::uint32_t prune_threshold{500};          // 0 disables auto-prune
    std::string cache_tags_header{"Cache-Tags"};
    bool generate_content_digests{true};
    int gzip_level{0};

    std::shared_ptr<backend::CacheBackend> cache;
    std::shared_ptr<lock::LockBackend> lock_backend;

    static StoreOptions from_settings(const config::StoreSettings& settings);
};

class Store {
public:
    /**
     * @throws httpstash::ConfigError if a backend can neither be taken from
     *         the options nor built from cache_directory, or an option is
     *         out of range
     */
    explicit Store(StoreOptions options);
    ~Store();

    // Non-copyable
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    /**
     * Find the stored response matching the request and its Vary headers
     *
     * @return nullopt on a miss, including a variant whose body is gone
     */
    std::optional<http::Response> lookup(const http::Request& request);

    /**
     * Store a response for the request
     *
     * The response gains X-Content-Digest and Content-Length headers when its
     * body is stored by digest.
     *
     * @return the cache key of the entry
     * @throws httpstash::WritePolicyError if the response has no max-age
     * @throws httpstash::StorageError if the body could not be stored
     */
    std::string write(const http::Request& request, http::Response& response);

    /**
     * Drop every variant stored for the request's URL. Shared bodies stay.
     */
    void invalidate(const http::Request& request);

    /**
     * Drop every variant stored for a URL
     *
     * @return true if an entry existed
     * @throws std::invalid_argument if the URL cannot be parsed
     */
    bool purge(std::string_view url);

    bool lock(const http::Request& request);
    bool unlock(const http::Request& request);
    bool is_locked(const http::Request& request) const;

    /**
     * Release every lock taken with lock()
     */
    void cleanup();

    /**
     * Invalidate every entry tagged with any of @p tags
     *
     * @return false if the backend rejected a tag
     * @throws httpstash::ConfigError if the cache backend does not support tags
     */
    bool invalidate_tags(const std::vector<std::string>& tags);

    /**
     * Remove expired entries, unless another prune pass holds the prune lock
     */
    void prune();

    /**
     * Remove every entry, unless another pass holds the cleanup lock
     */
    void clear();

    std::string cache_key(const http::Request& request) const;

    backend::Capability capabilities() const { return capabilities_; }
    const ContentStore& content_store() const { return content_; }

private:
    std::optional<MetadataEntries> load_entries(const std::string& key);

    std::vector<std::string> extract_tags(const http::Response& response) const;

    void auto_prune();

    StoreOptions options_;
    std::shared_ptr<backend::CacheBackend> cache_;
    backend::Capability capabilities_{backend::Capability::none};
    lock::LockManager locks_;
    ContentStore content_;
};

} // namespace httpstash::store

#endif // HTTPSTASH_STORE_STORE_HPP
