/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Errors - Fatal conditions raised to the caller
 *
 * Expected misses (no entry, no matching variant, vanished file) are never
 * exceptions; they are reported through std::optional / bool returns.
 */

#ifndef HTTPSTASH_UTIL_ERRORS_HPP
#define HTTPSTASH_UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace httpstash {

/**
 * Deployment mistake: missing backend/directory, invalid option value,
 * or an operation the configured backend cannot perform.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * The caller asked to store a response that must not be cached
 * (e.g. one without a max-age).
 */
class WritePolicyError : public std::runtime_error {
public:
    explicit WritePolicyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * The backend refused to persist something the store depends on.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace httpstash

#endif // HTTPSTASH_UTIL_ERRORS_HPP
