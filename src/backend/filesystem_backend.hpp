/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Filesystem Backend - Directory-based key-value storage shared between processes
 *
 * Layout under <directory>/http_cache/:
 *   items/ab/cd/<hash>  one MessagePack record per key
 *   tags/<hash>         current version of a tag
 *
 * Records remember the tag versions they were saved with; bumping a tag's
 * version invalidates every record saved before. Records are written to a
 * temporary file and renamed into place, so readers never see partial data.
 */

#ifndef HTTPSTASH_BACKEND_FILESYSTEM_BACKEND_HPP
#define HTTPSTASH_BACKEND_FILESYSTEM_BACKEND_HPP

#include "backend/cache_backend.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace httpstash::backend {

class FilesystemBackend : public CacheBackend {
public:
    /**
     * @throws httpstash::ConfigError if the directory cannot be created
     */
    explicit FilesystemBackend(const std::filesystem::path& directory);
    ~FilesystemBackend() override = default;

    FilesystemBackend(const FilesystemBackend&) = delete;
    FilesystemBackend& operator=(const FilesystemBackend&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    bool save_deferred(const std::string& key,
                       std::string value,
                       std::optional<std::chrono::seconds> ttl = std::nullopt,
                       const std::vector<std::string>& tags = {}) override;
    bool commit() override;
    bool remove(const std::string& key) override;
    bool clear() override;
    Capability capabilities() const override { return Capability::tags | Capability::prune; }
    bool invalidate_tags(const std::vector<std::string>& tags) override;
    bool prune() override;

    const std::filesystem::path& root() const { return root_; }

private:
    struct Record {
        std::string key;
        std::int64_t expires{0};                      // Unix seconds, 0 = never
        std::map<std::string, std::uint64_t> tags;    // Tag -> version at save time
        std::string value;
    };

    std::filesystem::path item_path(const std::string& key) const;
    std::filesystem::path tag_path(const std::string& tag) const;

    std::uint64_t tag_version(const std::string& tag) const;

    /**
     * A record is live if it has not expired and none of its tags moved on
     */
    bool is_live(const Record& record, std::int64_t now) const;

    static std::optional<Record> read_record(const std::filesystem::path& path);
    static bool write_atomically(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes);
    static std::vector<std::uint8_t> encode(const Record& record);
    static std::int64_t now_seconds();

    std::filesystem::path root_;
    std::mutex mutex_;
    std::unordered_map<std::string, Record> deferred_;
};

} // namespace httpstash::backend

#endif // HTTPSTASH_BACKEND_FILESYSTEM_BACKEND_HPP
