/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Cache Keys - Key derivation for metadata, variants and content
 *
 * Key families never collide with each other or with reserved names:
 * - "md" + XXH3    : metadata entry for a URL (scheme-independent)
 * - "en" + SHA-256 : content digest of an in-memory body
 * - "bf" + SHA-256 : content digest of a file-backed body
 * - 32 hex chars   : vary key of one stored variant
 */

#ifndef HTTPSTASH_CACHE_CACHE_KEY_HPP
#define HTTPSTASH_CACHE_CACHE_KEY_HPP

#include "http/message.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpstash::cache {

/**
 * Vary key used for responses that carry no Vary header
 */
inline constexpr std::string_view kNonVaryingKey = "non-varying";

inline constexpr std::string_view kMetadataPrefix = "md";
inline constexpr std::string_view kContentPrefix = "en";
inline constexpr std::string_view kFilePrefix = "bf";

/**
 * 128-bit XXH3 hash rendered as 32 lowercase hex characters
 */
std::string hash_hex(std::string_view data);

/**
 * SHA-256 rendered as 64 lowercase hex characters
 *
 * @throws httpstash::StorageError if the digest cannot be computed
 */
std::string sha256_hex(std::string_view data);

/**
 * SHA-256 of a file's contents, read in chunks
 *
 * @throws httpstash::StorageError if the file cannot be read
 */
std::string sha256_file_hex(const std::filesystem::path& path);

/**
 * Metadata key for a request: the URI with its "<scheme>://" prefix removed,
 * so http and https variants of a URL share one entry.
 */
std::string generate_cache_key(const http::Request& request);

/**
 * Key identifying the variant a request selects for the given Vary names.
 *
 * Names are lower-cased and sorted. Each non-cookie header contributes
 * "name:value" (empty when absent). If "cookie" is varied on, every request
 * cookie is appended as name=value in request order.
 *
 * @return kNonVaryingKey when @p vary is empty
 */
std::string generate_vary_key(std::vector<std::string> vary, const http::Request& request);

/**
 * True if the Vary names contain "*": such a variant never matches a request
 */
bool varies_on_everything(const std::vector<std::string>& vary);

/**
 * Content digest for a response body
 *
 * File-backed responses always get a "bf" digest. In-memory bodies get an
 * "en" digest, or nullopt when digests are disabled.
 */
std::optional<std::string> generate_content_digest(const http::Response& response, bool digests_enabled);

inline bool is_file_digest(std::string_view digest) {
    return digest.substr(0, kFilePrefix.size()) == kFilePrefix;
}

} // namespace httpstash::cache

#endif // HTTPSTASH_CACHE_CACHE_KEY_HPP
