/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Content Store - Deduplicated response bodies keyed by content digest
 *
 * Every variant whose body hashes identically references one digest entry.
 * The entry's lifetime only ever grows: it is the longest max-age of any
 * response that referenced it, so a short-lived response cannot cut short
 * content shared with a long-lived one.
 */

#ifndef HTTPSTASH_STORE_CONTENT_STORE_HPP
#define HTTPSTASH_STORE_CONTENT_STORE_HPP

#include "backend/cache_backend.hpp"
#include "http/message.hpp"
#include "store/entry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace httpstash::store {

/**
 * Header carrying the digest of a response's stored body
 */
inline constexpr std::string_view kContentDigestHeader = "X-Content-Digest";

struct ContentStoreOptions {
    bool generate_digests{true};   // false: bodies are inlined in the variant record
    int gzip_level{0};             // 0 disables compression of stored bodies
};

class ContentStore {
public:
    ContentStore(std::shared_ptr<backend::CacheBackend> backend, ContentStoreOptions options);

    /**
     * Make sure the response body is stored under its digest (deferred write)
     *
     * A response that already carries X-Content-Digest is left alone. On
     * success the response gets X-Content-Digest and, unless it uses
     * Transfer-Encoding, a matching Content-Length.
     *
     * @return the digest, or nullopt when digests are disabled and the body
     *         must be inlined by the caller
     * @throws httpstash::StorageError if the backend refuses the entry or a
     *         file-backed body cannot be read
     */
    std::optional<std::string> ensure_stored(http::Response& response);

    /**
     * Rebuild a response from a stored variant
     *
     * @return nullopt when the body is unavailable: no inline content, digest
     *         entry missing, file removed from disk, or gzip content that
     *         cannot be decoded for a client without gzip support
     */
    std::optional<http::Response> restore(const VariantRecord& record, const http::Request& request) const;

    /**
     * Read a digest entry
     */
    std::optional<ContentDigestEntry> fetch(const std::string& digest) const;

private:
    std::shared_ptr<backend::CacheBackend> backend_;
    ContentStoreOptions options_;
};

} // namespace httpstash::store

#endif // HTTPSTASH_STORE_CONTENT_STORE_HPP
