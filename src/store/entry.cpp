/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Stored Entries Implementation
 */

#include "store/entry.hpp"

#include "util/logger.hpp"

#include <boost/beast/core/string.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace httpstash::store {

using nlohmann::json;
namespace log_component = util::log_component;

namespace {

json to_binary(const std::string& bytes) {
    return json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

// Accept both binary and (older) string payloads
std::string bytes_of(const json& j) {
    if (j.is_binary()) {
        const auto& bin = j.get_binary();
        return std::string(bin.begin(), bin.end());
    }
    return j.get<std::string>();
}

json record_to_json(const VariantRecord& record) {
    json headers = json::array();
    for (const auto& [name, value] : record.headers) {
        headers.push_back(json::array({name, value}));
    }

    return json{
        {"vary", record.vary},
        {"headers", std::move(headers)},
        {"status", record.status},
        {"uri", record.uri},
        {"content", record.content ? to_binary(*record.content) : json(nullptr)}
    };
}

VariantRecord record_from_json(const json& j) {
    VariantRecord record;
    if (j.contains("vary")) {
        j.at("vary").get_to(record.vary);
    }
    j.at("status").get_to(record.status);
    if (j.contains("uri") && j.at("uri").is_string()) {
        j.at("uri").get_to(record.uri);
    }
    if (j.contains("content") && !j.at("content").is_null()) {
        record.content = bytes_of(j.at("content"));
    }

    const auto& headers = j.at("headers");
    if (headers.is_object()) {
        // Older layout: name -> [values]
        for (const auto& [name, values] : headers.items()) {
            if (values.is_array()) {
                for (const auto& value : values) {
                    record.headers.emplace_back(name, value.get<std::string>());
                }
            } else {
                record.headers.emplace_back(name, values.get<std::string>());
            }
        }
    } else {
        for (const auto& pair : headers) {
            record.headers.emplace_back(pair.at(0).get<std::string>(), pair.at(1).get<std::string>());
        }
    }
    return record;
}

} // namespace

std::string VariantRecord::header(std::string_view name) const {
    for (const auto& [header_name, value] : headers) {
        if (boost::beast::iequals(header_name, boost::beast::string_view(name.data(), name.size()))) {
            return value;
        }
    }
    return {};
}

const VariantRecord* MetadataEntries::find(std::string_view vary_key) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [vary_key](const value_type& item) { return item.first == vary_key; });
    return it == records_.end() ? nullptr : &it->second;
}

void MetadataEntries::put(std::string vary_key, VariantRecord record) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&vary_key](const value_type& item) { return item.first == vary_key; });
    if (it != records_.end()) {
        it->second = std::move(record);
    } else {
        records_.emplace_back(std::move(vary_key), std::move(record));
    }
}

bool MetadataEntries::erase(std::string_view vary_key) {
    auto removed = std::erase_if(records_, [vary_key](const value_type& item) { return item.first == vary_key; });
    return removed > 0;
}

std::string MetadataEntries::encode() const {
    json entries = json::array();
    for (const auto& [vary_key, record] : records_) {
        entries.push_back(json::array({vary_key, record_to_json(record)}));
    }

    auto bytes = json::to_msgpack(json{{"v", kEntryFormatVersion}, {"entries", std::move(entries)}});
    return std::string(bytes.begin(), bytes.end());
}

std::optional<MetadataEntries> MetadataEntries::decode(std::string_view data) {
    try {
        auto j = json::from_msgpack(data.begin(), data.end());
        if (!j.is_object()) {
            return std::nullopt;
        }

        MetadataEntries result;
        if (j.contains("v")) {
            for (const auto& item : j.at("entries")) {
                result.records_.emplace_back(item.at(0).get<std::string>(), record_from_json(item.at(1)));
            }
        } else {
            // Older layout: an object keyed by vary key
            for (const auto& [vary_key, record] : j.items()) {
                result.records_.emplace_back(vary_key, record_from_json(record));
            }
        }
        return result;
    } catch (const json::exception& e) {
        HTTPSTASH_LOG_WARN(log_component::Store, "Discarding unreadable metadata entry: {}", e.what());
        return std::nullopt;
    }
}

std::string ContentDigestEntry::encode() const {
    auto bytes = json::to_msgpack(json{
        {"v", kEntryFormatVersion},
        {"expires", expires},
        {"encoding", gzip ? "gzip" : "identity"},
        {"contents", to_binary(contents)}
    });
    return std::string(bytes.begin(), bytes.end());
}

std::optional<ContentDigestEntry> ContentDigestEntry::decode(std::string_view data) {
    try {
        auto j = json::from_msgpack(data.begin(), data.end());

        ContentDigestEntry entry;
        if (j.is_string() || j.is_binary()) {
            // Older releases stored the bare body
            entry.contents = bytes_of(j);
            return entry;
        }

        if (j.contains("expires")) {
            j.at("expires").get_to(entry.expires);
        }
        if (j.contains("encoding")) {
            entry.gzip = j.at("encoding").get<std::string>() == "gzip";
        }
        entry.contents = bytes_of(j.at("contents"));
        return entry;
    } catch (const json::exception& e) {
        HTTPSTASH_LOG_WARN(log_component::Store, "Discarding unreadable content entry: {}", e.what());
        return std::nullopt;
    }
}

} // namespace httpstash::store
