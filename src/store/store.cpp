/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Store Implementation
 */

#include "store/store.hpp"

#include "backend/filesystem_backend.hpp"
#include "cache/cache_key.hpp"
#include "lock/file_lock_backend.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <charconv>
#include <chrono>
#include <stdexcept>

namespace httpstash::store {

namespace log_component = util::log_component;

namespace {

StoreOptions validated(StoreOptions options) {
    if (options.gzip_level < 0 || options.gzip_level > 9) {
        throw ConfigError("The gzip_level option must be between 0 and 9");
    }
    if (options.cache_tags_header.empty()) {
        throw ConfigError("The cache_tags_header option cannot be empty");
    }
    return options;
}

std::shared_ptr<backend::CacheBackend> make_cache(const StoreOptions& options) {
    if (options.cache) {
        return options.cache;
    }
    if (options.cache_directory.empty()) {
        throw ConfigError("The cache_directory option is required unless you set the cache explicitly");
    }
    return std::make_shared<backend::FilesystemBackend>(options.cache_directory);
}

std::shared_ptr<lock::LockBackend> make_lock_backend(const StoreOptions& options) {
    if (options.lock_backend) {
        return options.lock_backend;
    }
    if (options.cache_directory.empty()) {
        throw ConfigError("The cache_directory option is required unless you set the lock_backend explicitly");
    }
    return std::make_shared<lock::FileLockBackend>(options.cache_directory);
}

std::uint64_t parse_counter(const std::optional<std::string>& stored) {
    std::uint64_t counter = 0;
    if (stored) {
        auto [ptr, ec] = std::from_chars(stored->data(), stored->data() + stored->size(), counter);
        if (ec != std::errc{} || ptr != stored->data() + stored->size()) {
            HTTPSTASH_LOG_WARN(log_component::Store, "Resetting unreadable write counter \"{}\"", *stored);
            return 0;
        }
    }
    return counter;
}

} // namespace

StoreOptions StoreOptions::from_settings(const config::StoreSettings& settings) {
    StoreOptions options;
    options.cache_directory = settings.cache_directory;
    options.prune_threshold = settings.prune_threshold;
    options.cache_tags_header = settings.cache_tags_header;
    options.generate_content_digests = settings.generate_content_digests;
    options.gzip_level = settings.gzip_level;
    return options;
}

Store::Store(StoreOptions options)
    : options_(validated(std::move(options)))
    , cache_(make_cache(options_))
    , capabilities_(cache_->capabilities())
    , locks_(make_lock_backend(options_))
    , content_(cache_, ContentStoreOptions{options_.generate_content_digests, options_.gzip_level}) {
    HTTPSTASH_LOG_DEBUG(log_component::Store, "Store ready: tags={}, prune={}, prune_threshold={}",
                        backend::has_capability(capabilities_, backend::Capability::tags),
                        backend::has_capability(capabilities_, backend::Capability::prune),
                        options_.prune_threshold);
}

Store::~Store() = default;

std::optional<http::Response> Store::lookup(const http::Request& request) {
    auto key = cache_key(request);
    auto entries = load_entries(key);
    if (!entries) {
        HTTPSTASH_LOG_DEBUG(log_component::Store, "Cache miss: {}", request.uri());
        return std::nullopt;
    }

    for (const auto& [vary_key, record] : *entries) {
        if (vary_key == cache::kNonVaryingKey) {
            HTTPSTASH_LOG_DEBUG(log_component::Store, "Cache hit: {}", request.uri());
            return content_.restore(record, request);
        }
        if (cache::varies_on_everything(record.vary)) {
            continue;
        }
        if (cache::generate_vary_key(record.vary, request) == vary_key) {
            HTTPSTASH_LOG_DEBUG(log_component::Store, "Cache hit: {} (variant {})", request.uri(), vary_key);
            return content_.restore(record, request);
        }
    }

    HTTPSTASH_LOG_DEBUG(log_component::Store, "No matching variant: {}", request.uri());
    return std::nullopt;
}

std::string Store::write(const http::Request& request, http::Response& response) {
    auto max_age = response.max_age();
    if (!max_age) {
        throw WritePolicyError("Cannot write a response without a max-age: " + request.uri());
    }

    auto key = cache_key(request);
    auto digest = content_.ensure_stored(response);

    auto entries = load_entries(key).value_or(MetadataEntries{});

    VariantRecord record;
    record.vary = response.vary();
    record.status = response.status();
    record.uri = request.uri();
    for (const auto& field : response.headers()) {
        if (field.name() == http::bhttp::field::age) {
            continue;
        }
        record.headers.emplace_back(http::to_string(field.name_string()), http::to_string(field.value()));
    }
    if (!digest) {
        record.content = response.body();
    }

    auto vary_key = cache::generate_vary_key(record.vary, request);
    entries.put(vary_key, std::move(record));
    if (response.has_vary()) {
        entries.erase(cache::kNonVaryingKey);
    }

    auto tags = extract_tags(response);

    auto_prune();

    if (!cache_->save_deferred(key, entries.encode(), std::chrono::seconds(*max_age), tags)) {
        throw StorageError("Unable to store the metadata entry for " + request.uri());
    }
    if (!cache_->commit()) {
        throw StorageError("Unable to commit cache writes for " + request.uri());
    }

    HTTPSTASH_LOG_DEBUG(log_component::Store, "Stored {} as {} (variant {}, {} variants, {} tags)",
                        request.uri(), key, vary_key, entries.size(), tags.size());
    return key;
}

void Store::invalidate(const http::Request& request) {
    auto key = cache_key(request);
    if (cache_->remove(key)) {
        HTTPSTASH_LOG_DEBUG(log_component::Store, "Invalidated {}", request.uri());
    }
}

bool Store::purge(std::string_view url) {
    auto request = http::Request::create(url);
    bool existed = cache_->remove(cache_key(request));
    HTTPSTASH_LOG_DEBUG(log_component::Store, "Purge {}: {}", request.uri(), existed ? "removed" : "not cached");
    return existed;
}

bool Store::lock(const http::Request& request) {
    return locks_.try_lock(cache_key(request));
}

bool Store::unlock(const http::Request& request) {
    return locks_.unlock(cache_key(request));
}

bool Store::is_locked(const http::Request& request) const {
    return locks_.is_locked(cache_key(request));
}

void Store::cleanup() {
    locks_.release_all();
}

bool Store::invalidate_tags(const std::vector<std::string>& tags) {
    if (!backend::has_capability(capabilities_, backend::Capability::tags)) {
        throw ConfigError("The cache backend does not support tag invalidation");
    }

    try {
        bool invalidated = cache_->invalidate_tags(tags);
        HTTPSTASH_LOG_DEBUG(log_component::Store, "Invalidated {} tags", tags.size());
        return invalidated;
    } catch (const std::invalid_argument& e) {
        HTTPSTASH_LOG_WARN(log_component::Store, "Tag invalidation rejected: {}", e.what());
        return false;
    }
}

void Store::prune() {
    if (!backend::has_capability(capabilities_, backend::Capability::prune)) {
        return;
    }

    bool ran = locks_.run_exclusive(std::string(kPruneLockName), [this]() {
        if (!cache_->prune()) {
            HTTPSTASH_LOG_WARN(log_component::Store, "Prune pass did not complete");
            return;
        }
        HTTPSTASH_LOG_DEBUG(log_component::Store, "Prune pass complete");
    });
    if (!ran) {
        HTTPSTASH_LOG_INFO(log_component::Store, "Prune skipped: another pass holds {}", kPruneLockName);
    }
}

void Store::clear() {
    bool ran = locks_.run_exclusive(std::string(kCleanupLockName), [this]() {
        if (!cache_->clear()) {
            HTTPSTASH_LOG_WARN(log_component::Store, "Clear did not complete");
            return;
        }
        HTTPSTASH_LOG_DEBUG(log_component::Store, "Cache cleared");
    });
    if (!ran) {
        HTTPSTASH_LOG_INFO(log_component::Store, "Clear skipped: another pass holds {}", kCleanupLockName);
    }
}

std::string Store::cache_key(const http::Request& request) const {
    return cache::generate_cache_key(request);
}

std::optional<MetadataEntries> Store::load_entries(const std::string& key) {
    auto stored = cache_->get(key);
    if (!stored) {
        return std::nullopt;
    }
    return MetadataEntries::decode(*stored);
}

std::vector<std::string> Store::extract_tags(const http::Response& response) const {
    std::vector<std::string> tags;
    for (const auto& value : response.header_values(options_.cache_tags_header)) {
        for (auto& tag : http::split_list(value)) {
            try {
                backend::validate_tag(tag);
            } catch (const std::invalid_argument& e) {
                HTTPSTASH_LOG_WARN(log_component::Store, "Ignoring cache tag: {}", e.what());
                continue;
            }
            tags.push_back(std::move(tag));
        }
    }
    return tags;
}

void Store::auto_prune() {
    if (options_.prune_threshold == 0) {
        return;
    }

    auto counter = parse_counter(cache_->get(std::string(kCounterKey)));
    if (counter > options_.prune_threshold) {
        prune();
        counter = 0;
    } else {
        ++counter;
    }

    if (!cache_->save_deferred(std::string(kCounterKey), std::to_string(counter))) {
        HTTPSTASH_LOG_WARN(log_component::Store, "Unable to store the write counter");
    }
}

} // namespace httpstash::store
