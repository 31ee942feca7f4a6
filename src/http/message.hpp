/**
 * HTTPSTASH - Shared HTTP Cache Store
 * HTTP Messages - Request/response values exchanged with the caching engine
 *
 * Headers live in boost::beast::http::fields (case-insensitive, multi-valued,
 * insertion ordered). A response either carries its body in memory or refers
 * to a file on disk.
 */

#ifndef HTTPSTASH_HTTP_MESSAGE_HPP
#define HTTPSTASH_HTTP_MESSAGE_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httpstash::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;

using Cookie = std::pair<std::string, std::string>;

/**
 * Upper bound for freshness lifetimes (2^31 seconds); larger delta-seconds
 * values are clamped to it.
 */
inline constexpr std::int64_t kMaxDeltaSeconds = 2147483648;

/**
 * Convert between std::string_view and beast::string_view
 */
inline beast::string_view to_beast(std::string_view sv) {
    return beast::string_view(sv.data(), sv.size());
}

inline std::string to_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

/**
 * Incoming request as seen by the store
 */
class Request {
public:
    Request() = default;

    /**
     * Build a request from an absolute URL ("https://host/path?q") or a bare
     * path ("/path", resolved against http://localhost).
     *
     * @throws std::invalid_argument on an empty or malformed URL
     */
    static Request create(std::string_view url, bhttp::verb method = bhttp::verb::get);

    /**
     * Adapt a Beast request header. The host is taken from the Host field
     * and cookies are parsed from the Cookie field.
     */
    static Request from_beast(const bhttp::request_header<>& header, std::string_view scheme = "http");

    bhttp::verb method() const { return method_; }
    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }

    /**
     * Path plus normalized query string
     */
    std::string target() const;

    /**
     * Normalized absolute URI: scheme://host[:port]/path[?query]
     */
    std::string uri() const;

    /**
     * First value of the header, empty string if absent
     */
    std::string header(std::string_view name) const;
    bool has_header(std::string_view name) const;

    /**
     * Setting or removing the Cookie field replaces the cookie list
     */
    void set_header(std::string_view name, std::string_view value);
    void remove_header(std::string_view name);
    const bhttp::fields& headers() const { return headers_; }

    /**
     * Cookies in request order. set_cookie/remove_cookie rewrite the
     * Cookie field to match.
     */
    const std::vector<Cookie>& cookies() const { return cookies_; }
    void set_cookie(std::string name, std::string value);
    bool remove_cookie(std::string_view name);

    /**
     * True if Accept-Encoding admits gzip (explicitly or via "*")
     */
    bool accepts_gzip() const;

private:
    void sync_cookie_header();

    bhttp::verb method_{bhttp::verb::get};
    std::string scheme_{"http"};
    std::string host_{"localhost"};
    std::string path_{"/"};
    std::string query_;
    bhttp::fields headers_;
    std::vector<Cookie> cookies_;
};

/**
 * Response to be stored or restored from the cache
 */
class Response {
public:
    explicit Response(std::string body = {}, unsigned status = 200);

    /**
     * Response whose body is the content of a file on disk
     */
    static Response from_file(std::filesystem::path file, unsigned status = 200);

    unsigned status() const { return status_; }
    void set_status(unsigned status) { status_ = status; }

    std::string header(std::string_view name) const;
    std::vector<std::string> header_values(std::string_view name) const;
    bool has_header(std::string_view name) const;
    void set_header(std::string_view name, std::string_view value);
    void add_header(std::string_view name, std::string_view value);
    void remove_header(std::string_view name);
    const bhttp::fields& headers() const { return headers_; }

    const std::string& body() const { return body_; }
    void set_body(std::string body) { body_ = std::move(body); }

    bool is_file() const { return file_.has_value(); }
    const std::filesystem::path& file() const { return *file_; }

    /**
     * Shared max-age in seconds: s-maxage wins over max-age, then
     * Expires minus Date (Date defaults to now). Values are clamped to
     * [0, kMaxDeltaSeconds]. nullopt when none of these are present.
     */
    std::optional<std::int64_t> max_age() const;

    /**
     * Header names listed in every Vary occurrence
     */
    std::vector<std::string> vary() const;
    bool has_vary() const { return !vary().empty(); }

    /**
     * Render as a Beast response; file-backed bodies are read from disk.
     *
     * @throws std::runtime_error if the backing file cannot be read
     */
    bhttp::response<bhttp::string_body> to_beast() const;

private:
    unsigned status_{200};
    bhttp::fields headers_;
    std::string body_;
    std::optional<std::filesystem::path> file_;
};

/**
 * Parse an IMF-fixdate ("Sun, 06 Nov 1994 08:49:37 GMT") into seconds since
 * the Unix epoch
 */
std::optional<std::int64_t> parse_http_date(std::string_view value);

/**
 * Split a comma separated header value into trimmed, non-empty tokens
 */
std::vector<std::string> split_list(std::string_view value);

} // namespace httpstash::http

#endif // HTTPSTASH_HTTP_MESSAGE_HPP
