/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Filesystem Backend Implementation
 */

#include "backend/filesystem_backend.hpp"

#include "cache/cache_key.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <sstream>
#include <system_error>

namespace httpstash::backend {

namespace fs = std::filesystem;
using util::log_component::Backend;

namespace {

std::string temp_suffix() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream oss;
    oss << ".tmp-" << std::hex << rng();
    return oss.str();
}

} // namespace

FilesystemBackend::FilesystemBackend(const fs::path& directory)
    : root_(directory / "http_cache") {
    std::error_code ec;
    fs::create_directories(root_ / "items", ec);
    if (!ec) {
        fs::create_directories(root_ / "tags", ec);
    }
    if (ec) {
        throw ConfigError("Cannot create cache directory " + root_.string() + ": " + ec.message());
    }

    HTTPSTASH_LOG_DEBUG(Backend, "Filesystem backend initialized: root={}", root_.string());
}

std::optional<std::string> FilesystemBackend::get(const std::string& key) {
    auto now = now_seconds();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = deferred_.find(key); it != deferred_.end()) {
            if (!is_live(it->second, now)) {
                return std::nullopt;
            }
            return it->second.value;
        }
    }

    auto path = item_path(key);
    auto record = read_record(path);
    if (!record || record->key != key) {
        return std::nullopt;
    }

    if (!is_live(*record, now)) {
        std::error_code ec;
        fs::remove(path, ec);
        return std::nullopt;
    }
    return std::move(record->value);
}

bool FilesystemBackend::save_deferred(const std::string& key,
                                      std::string value,
                                      std::optional<std::chrono::seconds> ttl,
                                      const std::vector<std::string>& tags) {
    Record record;
    record.key = key;
    record.value = std::move(value);
    if (ttl) {
        // 0 is reserved for "never expires"
        auto now = now_seconds();
        auto seconds = std::clamp<std::int64_t>(ttl->count(), 0, std::numeric_limits<std::int64_t>::max() - now);
        record.expires = now + seconds;
        if (record.expires == 0) {
            record.expires = 1;
        }
    }
    for (const auto& tag : tags) {
        record.tags[tag] = tag_version(tag);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    deferred_[key] = std::move(record);
    return true;
}

bool FilesystemBackend::commit() {
    std::unordered_map<std::string, Record> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(deferred_);
    }

    bool ok = true;
    for (const auto& [key, record] : pending) {
        if (!write_atomically(item_path(key), encode(record))) {
            HTTPSTASH_LOG_WARN(Backend, "Failed to persist cache item: key={}", key);
            ok = false;
        }
    }
    return ok;
}

bool FilesystemBackend::remove(const std::string& key) {
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        existed = deferred_.erase(key) > 0;
    }

    std::error_code ec;
    existed = fs::remove(item_path(key), ec) || existed;
    return existed;
}

bool FilesystemBackend::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_.clear();
    }

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        HTTPSTASH_LOG_WARN(Backend, "Failed to clear {}: {}", root_.string(), ec.message());
        return false;
    }
    fs::create_directories(root_ / "items", ec);
    fs::create_directories(root_ / "tags", ec);

    HTTPSTASH_LOG_DEBUG(Backend, "Filesystem backend cleared: root={}", root_.string());
    return !ec;
}

bool FilesystemBackend::invalidate_tags(const std::vector<std::string>& tags) {
    for (const auto& tag : tags) {
        validate_tag(tag);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(deferred_, [&tags](const auto& item) {
            for (const auto& tag : tags) {
                if (item.second.tags.count(tag) > 0) {
                    return true;
                }
            }
            return false;
        });
    }

    bool ok = true;
    for (const auto& tag : tags) {
        auto version = std::to_string(tag_version(tag) + 1);
        if (!write_atomically(tag_path(tag), std::vector<std::uint8_t>(version.begin(), version.end()))) {
            ok = false;
        }
    }
    return ok;
}

bool FilesystemBackend::prune() {
    auto now = now_seconds();
    std::size_t removed = 0;

    std::error_code ec;
    std::vector<fs::path> stale;
    for (auto it = fs::recursive_directory_iterator(root_ / "items", ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        // Skip directories and files another writer is still filling
        if (!it->is_regular_file(ec) || it->path().filename().string().find(".tmp-") != std::string::npos) {
            continue;
        }
        auto record = read_record(it->path());
        if (!record || !is_live(*record, now)) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        HTTPSTASH_LOG_WARN(Backend, "Prune scan of {} stopped early: {}", root_.string(), ec.message());
    }

    for (const auto& path : stale) {
        std::error_code remove_ec;
        if (fs::remove(path, remove_ec)) {
            ++removed;
        }
    }

    HTTPSTASH_LOG_DEBUG(Backend, "Filesystem backend pruned: {} items removed", removed);
    return !ec;
}

fs::path FilesystemBackend::item_path(const std::string& key) const {
    auto hash = cache::hash_hex(key);
    return root_ / "items" / hash.substr(0, 2) / hash.substr(2, 2) / hash;
}

fs::path FilesystemBackend::tag_path(const std::string& tag) const {
    return root_ / "tags" / cache::hash_hex(tag);
}

std::uint64_t FilesystemBackend::tag_version(const std::string& tag) const {
    std::ifstream in(tag_path(tag));
    std::uint64_t version = 0;
    if (in >> version) {
        return version;
    }
    return 0;
}

bool FilesystemBackend::is_live(const Record& record, std::int64_t now) const {
    if (record.expires != 0 && now >= record.expires) {
        return false;
    }
    for (const auto& [tag, version] : record.tags) {
        if (tag_version(tag) != version) {
            return false;
        }
    }
    return true;
}

std::optional<FilesystemBackend::Record> FilesystemBackend::read_record(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        auto j = nlohmann::json::from_msgpack(bytes);
        Record record;
        j.at("key").get_to(record.key);
        j.at("expires").get_to(record.expires);
        j.at("tags").get_to(record.tags);
        const auto& value = j.at("value").get_binary();
        record.value.assign(value.begin(), value.end());
        return record;
    } catch (const nlohmann::json::exception& e) {
        HTTPSTASH_LOG_WARN(Backend, "Ignoring unreadable cache item {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FilesystemBackend::write_atomically(const fs::path& path, const std::vector<std::uint8_t>& bytes) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return false;
    }

    auto temp = path;
    temp += temp_suffix();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return false;
    }
    return true;
}

std::vector<std::uint8_t> FilesystemBackend::encode(const Record& record) {
    nlohmann::json j = {
        {"key", record.key},
        {"expires", record.expires},
        {"tags", record.tags},
        {"value", nlohmann::json::binary(std::vector<std::uint8_t>(record.value.begin(), record.value.end()))}
    };
    return nlohmann::json::to_msgpack(j);
}

std::int64_t FilesystemBackend::now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace httpstash::backend
