#include "cache/cache_key.hpp"
#include "util/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace httpstash::cache {
namespace {

namespace fs = std::filesystem;

TEST(CacheKeyTest, SchemeDoesNotChangeKey) {
    auto http = http::Request::create("http://example.com/page?a=1");
    auto https = http::Request::create("https://example.com/page?a=1");

    EXPECT_EQ(generate_cache_key(http), generate_cache_key(https));
}

TEST(CacheKeyTest, KeyHasMetadataPrefixAndHexHash) {
    auto key = generate_cache_key(http::Request::create("http://example.com/"));

    ASSERT_EQ(key.size(), 2u + 32u);
    EXPECT_EQ(key.substr(0, 2), "md");
    EXPECT_EQ(key.find_first_not_of("0123456789abcdef", 2), std::string::npos);
}

TEST(CacheKeyTest, DifferentPathsGetDifferentKeys) {
    EXPECT_NE(generate_cache_key(http::Request::create("http://example.com/a")),
              generate_cache_key(http::Request::create("http://example.com/b")));
}

TEST(CacheKeyTest, DifferentHostsGetDifferentKeys) {
    EXPECT_NE(generate_cache_key(http::Request::create("http://one.example/")),
              generate_cache_key(http::Request::create("http://two.example/")));
}

TEST(CacheKeyTest, QueryOrderIsNormalized) {
    EXPECT_EQ(generate_cache_key(http::Request::create("http://example.com/?b=2&a=1")),
              generate_cache_key(http::Request::create("http://example.com/?a=1&b=2")));
}

TEST(CacheKeyTest, HashIsStable) {
    EXPECT_EQ(hash_hex("hello world"), hash_hex("hello world"));
    EXPECT_NE(hash_hex("hello world"), hash_hex("hello world!"));
    EXPECT_EQ(hash_hex("").size(), 32u);
}

TEST(CacheKeyTest, Sha256MatchesKnownDigests) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("hello world"), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(VaryKeyTest, EmptyVaryGivesSentinel) {
    auto request = http::Request::create("http://example.com/");
    EXPECT_EQ(generate_vary_key({}, request), kNonVaryingKey);
}

TEST(VaryKeyTest, NameOrderAndCaseDoNotMatter) {
    auto request = http::Request::create("http://example.com/");
    request.set_header("Accept-Language", "en");
    request.set_header("Accept-Encoding", "gzip");

    EXPECT_EQ(generate_vary_key({"Accept-Language", "Accept-Encoding"}, request),
              generate_vary_key({"accept-encoding", "ACCEPT-LANGUAGE"}, request));
}

TEST(VaryKeyTest, HeaderValueChangesKey) {
    auto english = http::Request::create("http://example.com/");
    english.set_header("Accept-Language", "en");
    auto french = http::Request::create("http://example.com/");
    french.set_header("Accept-Language", "fr");

    EXPECT_NE(generate_vary_key({"Accept-Language"}, english),
              generate_vary_key({"Accept-Language"}, french));
}

TEST(VaryKeyTest, MissingHeaderDiffersFromPresentHeader) {
    auto without = http::Request::create("http://example.com/");
    auto with = http::Request::create("http://example.com/");
    with.set_header("Accept-Language", "en");

    EXPECT_NE(generate_vary_key({"Accept-Language"}, without),
              generate_vary_key({"Accept-Language"}, with));
}

TEST(VaryKeyTest, StarVariesOnEverything) {
    EXPECT_TRUE(varies_on_everything({"Accept-Language", "*"}));
    EXPECT_FALSE(varies_on_everything({"Accept-Language"}));
    EXPECT_FALSE(varies_on_everything({}));
}

TEST(VaryKeyTest, CookiesAreComparedPairByPair) {
    auto first = http::Request::create("http://example.com/");
    first.set_cookie("session", "abc");
    auto same = http::Request::create("http://example.com/");
    same.set_cookie("session", "abc");
    auto other = http::Request::create("http://example.com/");
    other.set_cookie("session", "xyz");

    EXPECT_EQ(generate_vary_key({"Cookie"}, first), generate_vary_key({"Cookie"}, same));
    EXPECT_NE(generate_vary_key({"Cookie"}, first), generate_vary_key({"Cookie"}, other));
}

TEST(VaryKeyTest, CookiesIgnoredUnlessVaried) {
    auto first = http::Request::create("http://example.com/");
    first.set_cookie("session", "abc");
    first.set_header("Accept", "text/html");
    auto second = http::Request::create("http://example.com/");
    second.set_cookie("session", "xyz");
    second.set_header("Accept", "text/html");

    EXPECT_EQ(generate_vary_key({"Accept"}, first), generate_vary_key({"Accept"}, second));
}

TEST(VaryKeyTest, CookieOrderIsSignificant) {
    auto first = http::Request::create("http://example.com/");
    first.set_cookie("a", "1");
    first.set_cookie("b", "2");
    auto second = http::Request::create("http://example.com/");
    second.set_cookie("b", "2");
    second.set_cookie("a", "1");

    EXPECT_NE(generate_vary_key({"Cookie"}, first), generate_vary_key({"Cookie"}, second));
}

TEST(ContentDigestTest, BodyDigestUsesContentPrefix) {
    http::Response response("hello world");

    auto digest = generate_content_digest(response, true);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, "enb94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(ContentDigestTest, DisabledDigestsReturnNothingForBodies) {
    http::Response response("hello world");
    EXPECT_FALSE(generate_content_digest(response, false).has_value());
}

TEST(ContentDigestTest, FilesAlwaysGetDigest) {
    auto path = fs::temp_directory_path() / "httpstash_cache_key_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "file contents";
    }

    auto response = http::Response::from_file(path);
    auto digest = generate_content_digest(response, false);

    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, "bf" + sha256_hex("file contents"));
    EXPECT_TRUE(is_file_digest(*digest));

    fs::remove(path);
}

TEST(ContentDigestTest, UnreadableFileThrows) {
    auto response = http::Response::from_file("/nonexistent/httpstash/file");
    EXPECT_THROW(generate_content_digest(response, true), StorageError);
}

} // namespace
} // namespace httpstash::cache
