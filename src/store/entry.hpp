/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Stored Entries - Values persisted under metadata and content digest keys
 *
 * Values are MessagePack documents (nlohmann::json), tagged with a format
 * version. Values written by older releases are migrated when read.
 */

#ifndef HTTPSTASH_STORE_ENTRY_HPP
#define HTTPSTASH_STORE_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httpstash::store {

inline constexpr int kEntryFormatVersion = 2;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * One stored variant of a URL
 */
struct VariantRecord {
    std::vector<std::string> vary;        // Vary header names as sent by the origin
    HeaderList headers;                   // Response headers minus Age, in order
    unsigned status{200};
    std::string uri;                      // For debugging only
    std::optional<std::string> content;   // Inline body when digests are disabled

    /**
     * First value of a stored header (case-insensitive), empty if absent
     */
    std::string header(std::string_view name) const;
};

/**
 * Vary key -> variant, in insertion order
 */
class MetadataEntries {
public:
    using value_type = std::pair<std::string, VariantRecord>;

    bool empty() const { return records_.empty(); }
    std::size_t size() const { return records_.size(); }

    auto begin() const { return records_.begin(); }
    auto end() const { return records_.end(); }

    const VariantRecord* find(std::string_view vary_key) const;

    /**
     * Insert, or replace in place when the key already exists
     */
    void put(std::string vary_key, VariantRecord record);

    bool erase(std::string_view vary_key);

    std::string encode() const;

    /**
     * Decode a stored value, migrating older layouts
     *
     * @return nullopt if the value is unreadable
     */
    static std::optional<MetadataEntries> decode(std::string_view data);

private:
    std::vector<value_type> records_;
};

/**
 * Deduplicated response body shared by every variant with the same digest
 */
struct ContentDigestEntry {
    std::int64_t expires{0};   // Highest max-age of any writer; never decreases
    bool gzip{false};          // contents are gzip-encoded by the store
    std::string contents;      // Body bytes, or file path for "bf" digests

    std::string encode() const;

    /**
     * Decode a stored value; a bare string from older releases is read as
     * identity-encoded contents with expires = 0
     *
     * @return nullopt if the value is unreadable
     */
    static std::optional<ContentDigestEntry> decode(std::string_view data);
};

} // namespace httpstash::store

#endif // HTTPSTASH_STORE_ENTRY_HPP
