/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Cache Key Implementation - XXH3 keys, SHA-256 content digests
 */

#include "cache/cache_key.hpp"

#include "util/errors.hpp"

#include <openssl/evp.h>
#include <xxhash.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace httpstash::cache {

namespace {

std::string to_hex(const XXH128_hash_t& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << hash.high64
        << std::setw(16) << hash.low64;
    return oss.str();
}

std::string to_hex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw StorageError("Unable to initialize SHA-256 digest");
    }
    return ctx;
}

std::string finish_sha256(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
    unsigned int size = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &size) != 1) {
        throw StorageError("Unable to finalize SHA-256 digest");
    }
    return to_hex(digest.data(), size);
}

} // namespace

std::string hash_hex(std::string_view data) {
    return to_hex(XXH3_128bits(data.data(), data.size()));
}

std::string sha256_hex(std::string_view data) {
    auto ctx = new_sha256_context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw StorageError("Unable to compute SHA-256 digest");
    }
    return finish_sha256(ctx.get());
}

std::string sha256_file_hex(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("Cannot read response file: " + path.string());
    }

    auto ctx = new_sha256_context();
    std::array<char, 64 * 1024> buffer;
    while (in) {
        in.read(buffer.data(), buffer.size());
        auto count = in.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            throw StorageError("Unable to compute SHA-256 digest of " + path.string());
        }
    }
    if (in.bad()) {
        throw StorageError("Error while reading response file: " + path.string());
    }

    return finish_sha256(ctx.get());
}

std::string generate_cache_key(const http::Request& request) {
    // Strip scheme to treat https and http the same
    auto uri = request.uri();
    auto without_scheme = std::string_view(uri).substr(request.scheme().size() + 3);
    return std::string(kMetadataPrefix) + hash_hex(without_scheme);
}

std::string generate_vary_key(std::vector<std::string> vary, const http::Request& request) {
    if (vary.empty()) {
        return std::string(kNonVaryingKey);
    }

    for (auto& name : vary) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    std::sort(vary.begin(), vary.end());

    std::string hash_data;
    bool vary_on_cookie = false;
    for (const auto& name : vary) {
        if (name == "cookie") {
            vary_on_cookie = true;
            continue;
        }
        hash_data += name;
        hash_data += ':';
        hash_data += request.header(name);
    }

    // Cookies are multi-valued, so they are compared pair by pair
    if (vary_on_cookie) {
        hash_data += "cookies:";
        for (const auto& [name, value] : request.cookies()) {
            hash_data += name;
            hash_data += '=';
            hash_data += value;
            hash_data += ';';
        }
    }

    return hash_hex(hash_data);
}

bool varies_on_everything(const std::vector<std::string>& vary) {
    return std::find(vary.begin(), vary.end(), "*") != vary.end();
}

std::optional<std::string> generate_content_digest(const http::Response& response, bool digests_enabled) {
    if (response.is_file()) {
        return std::string(kFilePrefix) + sha256_file_hex(response.file());
    }

    if (!digests_enabled) {
        return std::nullopt;
    }

    return std::string(kContentPrefix) + sha256_hex(response.body());
}

} // namespace httpstash::cache
