/**
 * HTTPSTASH - Shared HTTP Cache Store
 * HTTP Messages Implementation
 */

#include "http/message.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fstream>
#include <iterator>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace httpstash::http {

namespace {

std::string to_lower(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// Sort query parameters by name so equivalent queries produce one URI
std::string normalize_query(std::string_view query) {
    std::vector<std::string> params;
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = query.size();
        }
        auto param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            params.emplace_back(param);
        }
        pos = amp + 1;
    }

    std::stable_sort(params.begin(), params.end(), [](const std::string& a, const std::string& b) {
        return std::string_view(a).substr(0, a.find('=')) < std::string_view(b).substr(0, b.find('='));
    });

    std::string normalized;
    for (const auto& param : params) {
        if (!normalized.empty()) {
            normalized.push_back('&');
        }
        normalized += param;
    }
    return normalized;
}

// Lower-case host, drop userinfo and the scheme's default port
std::string normalize_host(std::string_view authority, std::string_view scheme) {
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    std::string host = to_lower(authority);

    auto colon = host.rfind(':');
    if (colon != std::string::npos && host.find(']', colon) == std::string::npos) {
        auto port = std::string_view(host).substr(colon + 1);
        if (port.empty() || (scheme == "http" && port == "80") || (scheme == "https" && port == "443")) {
            host.erase(colon);
        }
    }
    return host;
}

std::vector<Cookie> parse_cookie_header(std::string_view value) {
    std::vector<Cookie> cookies;
    std::size_t pos = 0;
    while (pos < value.size()) {
        auto semi = value.find(';', pos);
        if (semi == std::string_view::npos) {
            semi = value.size();
        }
        auto pair = trim(value.substr(pos, semi - pos));
        if (auto eq = pair.find('='); eq != std::string_view::npos && eq > 0) {
            cookies.emplace_back(std::string(trim(pair.substr(0, eq))),
                                 std::string(trim(pair.substr(eq + 1))));
        }
        pos = semi + 1;
    }
    return cookies;
}

// Cache-Control delta-seconds: digits only, overflow saturates at kMaxDeltaSeconds
std::optional<std::int64_t> parse_delta_seconds(std::string_view arg) {
    if (arg.empty() || arg.find_first_not_of("0123456789") != std::string_view::npos) {
        return std::nullopt;
    }
    std::int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), seconds);
    if (ec == std::errc::result_out_of_range) {
        return kMaxDeltaSeconds;
    }
    if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
        return std::nullopt;
    }
    return std::min(seconds, kMaxDeltaSeconds);
}

std::vector<std::string> values_of(const bhttp::fields& fields, std::string_view name) {
    std::vector<std::string> values;
    auto range = fields.equal_range(to_beast(name));
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(to_string(it->value()));
    }
    return values;
}

} // namespace

std::optional<std::int64_t> parse_http_date(std::string_view value) {
    namespace pt = boost::posix_time;

    auto text = trim(value);
    if (text.size() <= 4 || text.substr(text.size() - 4) != " GMT") {
        return std::nullopt;
    }
    text.remove_suffix(4);

    std::istringstream in{std::string(text)};
    in.imbue(std::locale(std::locale::classic(), new pt::time_input_facet("%a, %d %b %Y %H:%M:%S")));
    pt::ptime time(pt::not_a_date_time);
    in >> time;
    if (in.fail() || time.is_special()) {
        return std::nullopt;
    }
    return (time - pt::from_time_t(0)).total_seconds();
}

std::vector<std::string> split_list(std::string_view value) {
    std::vector<std::string> items;
    std::size_t pos = 0;
    while (pos <= value.size()) {
        auto comma = value.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = value.size();
        }
        auto item = trim(value.substr(pos, comma - pos));
        if (!item.empty()) {
            items.emplace_back(item);
        }
        pos = comma + 1;
    }
    return items;
}

// Request

Request Request::create(std::string_view url, bhttp::verb method) {
    if (url.empty()) {
        throw std::invalid_argument("Cannot create a request from an empty URL");
    }

    Request request;
    request.method_ = method;

    std::string_view rest = url;
    if (auto sep = rest.find("://"); sep != std::string_view::npos) {
        request.scheme_ = to_lower(rest.substr(0, sep));
        if (request.scheme_ != "http" && request.scheme_ != "https") {
            throw std::invalid_argument("Unsupported URL scheme: " + request.scheme_);
        }
        rest.remove_prefix(sep + 3);

        auto path_start = rest.find_first_of("/?#");
        auto authority = rest.substr(0, path_start);
        if (authority.empty()) {
            throw std::invalid_argument("URL has no host: " + std::string(url));
        }
        request.host_ = normalize_host(authority, request.scheme_);
        rest = path_start == std::string_view::npos ? std::string_view{} : rest.substr(path_start);
    }

    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto question = rest.find('?');
    auto path = rest.substr(0, question);
    request.path_ = path.empty() ? "/" : std::string(path);
    if (request.path_.front() != '/') {
        request.path_.insert(request.path_.begin(), '/');
    }
    if (question != std::string_view::npos) {
        request.query_ = normalize_query(rest.substr(question + 1));
    }

    request.headers_.set(bhttp::field::host, request.host_);
    return request;
}

Request Request::from_beast(const bhttp::request_header<>& header, std::string_view scheme) {
    std::string host = "localhost";
    if (auto it = header.find(bhttp::field::host); it != header.end() && !it->value().empty()) {
        host = to_string(it->value());
    }

    std::string url = std::string(scheme) + "://" + host + to_string(header.target());
    auto request = create(url, header.method());

    for (const auto& field : header) {
        request.headers_.insert(field.name_string(), field.value());
    }
    // create() already set Host; keep the first occurrence only
    request.headers_.set(bhttp::field::host, request.host_);

    for (const auto& value : values_of(header, "Cookie")) {
        auto parsed = parse_cookie_header(value);
        std::move(parsed.begin(), parsed.end(), std::back_inserter(request.cookies_));
    }
    return request;
}

std::string Request::target() const {
    return query_.empty() ? path_ : path_ + "?" + query_;
}

std::string Request::uri() const {
    return scheme_ + "://" + host_ + target();
}

std::string Request::header(std::string_view name) const {
    auto it = headers_.find(to_beast(name));
    return it == headers_.end() ? std::string{} : to_string(it->value());
}

bool Request::has_header(std::string_view name) const {
    return headers_.find(to_beast(name)) != headers_.end();
}

void Request::set_header(std::string_view name, std::string_view value) {
    headers_.set(to_beast(name), to_beast(value));
    if (beast::iequals(to_beast(name), "cookie")) {
        cookies_ = parse_cookie_header(value);
    }
}

void Request::remove_header(std::string_view name) {
    headers_.erase(to_beast(name));
    if (beast::iequals(to_beast(name), "cookie")) {
        cookies_.clear();
    }
}

void Request::set_cookie(std::string name, std::string value) {
    for (auto& cookie : cookies_) {
        if (cookie.first == name) {
            cookie.second = std::move(value);
            sync_cookie_header();
            return;
        }
    }
    cookies_.emplace_back(std::move(name), std::move(value));
    sync_cookie_header();
}

bool Request::remove_cookie(std::string_view name) {
    auto it = std::find_if(cookies_.begin(), cookies_.end(),
                           [name](const Cookie& cookie) { return cookie.first == name; });
    if (it == cookies_.end()) {
        return false;
    }
    cookies_.erase(it);
    sync_cookie_header();
    return true;
}

// The Cookie field always mirrors the parsed cookie list
void Request::sync_cookie_header() {
    if (cookies_.empty()) {
        headers_.erase(bhttp::field::cookie);
        return;
    }
    std::string value;
    for (const auto& [name, cookie_value] : cookies_) {
        if (!value.empty()) {
            value += "; ";
        }
        value += name;
        value += '=';
        value += cookie_value;
    }
    headers_.set(bhttp::field::cookie, value);
}

bool Request::accepts_gzip() const {
    for (const auto& value : values_of(headers_, "Accept-Encoding")) {
        for (const auto& item : split_list(value)) {
            auto lower = to_lower(item);
            auto semi = lower.find(';');
            auto coding = std::string(trim(std::string_view(lower).substr(0, semi)));
            if (coding != "gzip" && coding != "x-gzip" && coding != "*") {
                continue;
            }
            if (semi != std::string::npos) {
                auto params = std::string_view(lower).substr(semi + 1);
                auto q = params.find("q=");
                if (q != std::string_view::npos) {
                    auto qvalue = trim(params.substr(q + 2));
                    if (qvalue.find_first_not_of("0.") == std::string_view::npos) {
                        continue; // q=0 means "not acceptable"
                    }
                }
            }
            return true;
        }
    }
    return false;
}

// Response

Response::Response(std::string body, unsigned status)
    : status_(status)
    , body_(std::move(body)) {
}

Response Response::from_file(std::filesystem::path file, unsigned status) {
    Response response({}, status);
    response.file_ = std::move(file);
    return response;
}

std::string Response::header(std::string_view name) const {
    auto it = headers_.find(http::to_beast(name));
    return it == headers_.end() ? std::string{} : to_string(it->value());
}

std::vector<std::string> Response::header_values(std::string_view name) const {
    return values_of(headers_, name);
}

bool Response::has_header(std::string_view name) const {
    return headers_.find(http::to_beast(name)) != headers_.end();
}

void Response::set_header(std::string_view name, std::string_view value) {
    headers_.set(http::to_beast(name), http::to_beast(value));
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers_.insert(http::to_beast(name), http::to_beast(value));
}

void Response::remove_header(std::string_view name) {
    headers_.erase(http::to_beast(name));
}

std::optional<std::int64_t> Response::max_age() const {
    std::optional<std::int64_t> max_age;
    std::optional<std::int64_t> shared_max_age;

    for (const auto& value : header_values("Cache-Control")) {
        for (const auto& directive : split_list(value)) {
            auto lower = to_lower(directive);
            auto eq = lower.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            auto name = trim(std::string_view(lower).substr(0, eq));
            auto arg = trim(std::string_view(lower).substr(eq + 1));
            if (!arg.empty() && arg.front() == '"' && arg.size() >= 2 && arg.back() == '"') {
                arg = arg.substr(1, arg.size() - 2);
            }

            auto seconds = parse_delta_seconds(arg);
            if (!seconds) {
                continue;
            }

            if (name == "s-maxage") {
                shared_max_age = seconds;
            } else if (name == "max-age") {
                max_age = seconds;
            }
        }
    }

    if (shared_max_age) {
        return shared_max_age;
    }
    if (max_age) {
        return max_age;
    }

    if (!has_header("Expires")) {
        return std::nullopt;
    }

    // An unparsable Expires means "already expired"
    auto expires = parse_http_date(header("Expires"));
    if (!expires) {
        return 0;
    }
    auto date = parse_http_date(header("Date"));
    if (!date) {
        date = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
    return std::clamp<std::int64_t>(*expires - *date, 0, kMaxDeltaSeconds);
}

std::vector<std::string> Response::vary() const {
    std::vector<std::string> names;
    for (const auto& value : header_values("Vary")) {
        std::string token;
        for (char c : value) {
            if (c == ',' || c == ' ' || c == '\t') {
                if (!token.empty()) {
                    names.push_back(std::move(token));
                    token.clear();
                }
            } else {
                token.push_back(c);
            }
        }
        if (!token.empty()) {
            names.push_back(std::move(token));
        }
    }
    return names;
}

bhttp::response<bhttp::string_body> Response::to_beast() const {
    bhttp::response<bhttp::string_body> res;
    res.result(status_);
    for (const auto& field : headers_) {
        res.insert(field.name_string(), field.value());
    }

    if (file_) {
        std::ifstream in(*file_, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot read response file: " + file_->string());
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        res.body() = contents.str();
    } else {
        res.body() = body_;
    }
    return res;
}

} // namespace httpstash::http
