/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Gzip - zlib-backed gzip encoding of stored bodies
 */

#ifndef HTTPSTASH_UTIL_GZIP_HPP
#define HTTPSTASH_UTIL_GZIP_HPP

#include <optional>
#include <string>
#include <string_view>

namespace httpstash::util {

/**
 * Gzip-encode @p input at @p level (1 = fastest, 9 = best)
 *
 * @return nullopt if zlib reports an error
 */
std::optional<std::string> gzip_encode(std::string_view input, int level);

/**
 * Decode a gzip stream
 *
 * @return nullopt on corrupt or truncated input
 */
std::optional<std::string> gzip_decode(std::string_view input);

} // namespace httpstash::util

#endif // HTTPSTASH_UTIL_GZIP_HPP
