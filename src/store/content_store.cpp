/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Content Store Implementation
 */

#include "store/content_store.hpp"

#include "cache/cache_key.hpp"
#include "util/errors.hpp"
#include "util/gzip.hpp"
#include "util/logger.hpp"

#include <boost/beast/core/string.hpp>

#include <chrono>
#include <filesystem>
#include <system_error>

namespace httpstash::store {

namespace fs = std::filesystem;
using util::log_component::Content;

namespace {

bool is_gzip(std::string_view coding) {
    return boost::beast::iequals(http::to_beast(coding), "gzip");
}

} // namespace

ContentStore::ContentStore(std::shared_ptr<backend::CacheBackend> backend, ContentStoreOptions options)
    : backend_(std::move(backend))
    , options_(options) {
}

std::optional<std::string> ContentStore::ensure_stored(http::Response& response) {
    // Responses restored from the cache already point at their content
    if (response.has_header(kContentDigestHeader)) {
        return response.header(kContentDigestHeader);
    }

    auto digest = cache::generate_content_digest(response, options_.generate_digests);
    if (!digest) {
        return std::nullopt;
    }

    auto max_age = response.max_age().value_or(0);
    bool changed = false;

    ContentDigestEntry entry;
    std::optional<ContentDigestEntry> existing;
    if (auto stored = backend_->get(*digest)) {
        existing = ContentDigestEntry::decode(*stored);
    }

    if (existing) {
        entry = std::move(*existing);
    } else {
        if (response.is_file()) {
            entry.contents = fs::absolute(response.file()).string();
        } else if (options_.gzip_level > 0 && !response.has_header("Content-Encoding")) {
            if (auto encoded = util::gzip_encode(response.body(), options_.gzip_level)) {
                entry.contents = std::move(*encoded);
                entry.gzip = true;
            } else {
                HTTPSTASH_LOG_WARN(Content, "Gzip encoding failed, storing {} uncompressed", *digest);
                entry.contents = response.body();
            }
        } else {
            entry.contents = response.body();
        }
        changed = true;
    }

    // Keep the content for as long as its longest-lived referrer
    if (max_age > entry.expires) {
        entry.expires = max_age;
        changed = true;
    }

    if (changed) {
        if (!backend_->save_deferred(*digest, entry.encode(), std::chrono::seconds(entry.expires))) {
            throw StorageError("Unable to store the entity.");
        }
        HTTPSTASH_LOG_DEBUG(Content, "Content stored: digest={}, expires={}, gzip={}",
                            *digest, entry.expires, entry.gzip);
    }

    response.set_header(kContentDigestHeader, *digest);

    if (!response.has_header("Transfer-Encoding")) {
        std::uintmax_t length = response.body().size();
        if (response.is_file()) {
            std::error_code ec;
            length = fs::file_size(response.file(), ec);
            if (ec) {
                throw StorageError("Cannot stat response file " + response.file().string() + ": " + ec.message());
            }
        }
        response.set_header("Content-Length", std::to_string(length));
    }

    return digest;
}

std::optional<http::Response> ContentStore::restore(const VariantRecord& record, const http::Request& request) const {
    auto apply_headers = [&record](http::Response& response) {
        for (const auto& [name, value] : record.headers) {
            response.add_header(name, value);
        }
    };

    auto digest = record.header(kContentDigestHeader);
    if (digest.empty()) {
        if (!record.content) {
            HTTPSTASH_LOG_DEBUG(Content, "Variant for {} has neither digest nor inline content", record.uri);
            return std::nullopt;
        }
        http::Response response(*record.content, record.status);
        apply_headers(response);
        return response;
    }

    auto entry = fetch(digest);
    if (!entry) {
        HTTPSTASH_LOG_DEBUG(Content, "Content entry missing: digest={}", digest);
        return std::nullopt;
    }

    if (cache::is_file_digest(digest)) {
        std::error_code ec;
        if (!fs::exists(entry->contents, ec)) {
            HTTPSTASH_LOG_DEBUG(Content, "Cached file no longer exists: {}", entry->contents);
            return std::nullopt;
        }
        auto response = http::Response::from_file(entry->contents, record.status);
        apply_headers(response);
        return response;
    }

    http::Response response(std::move(entry->contents), record.status);
    apply_headers(response);

    if (!entry->gzip && !is_gzip(record.header("Content-Encoding"))) {
        return response;
    }

    if (request.accepts_gzip()) {
        response.set_header("Content-Encoding", "gzip");
    } else {
        auto decoded = util::gzip_decode(response.body());
        if (!decoded) {
            HTTPSTASH_LOG_WARN(Content, "Cannot decode gzip content: digest={}", digest);
            return std::nullopt;
        }
        response.set_body(std::move(*decoded));
        response.remove_header("Content-Encoding");
    }

    if (!response.has_header("Transfer-Encoding")) {
        response.set_header("Content-Length", std::to_string(response.body().size()));
    }
    return response;
}

std::optional<ContentDigestEntry> ContentStore::fetch(const std::string& digest) const {
    auto stored = backend_->get(digest);
    if (!stored) {
        return std::nullopt;
    }
    return ContentDigestEntry::decode(*stored);
}

} // namespace httpstash::store
