#include "backend/memory_backend.hpp"
#include "cache/cache_key.hpp"
#include "lock/memory_lock_backend.hpp"
#include "mocks.hpp"
#include "store/store.hpp"
#include "util/errors.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

namespace httpstash::store {
namespace {

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::Return;

http::Response cacheable(std::string body, int max_age = 120) {
    http::Response response(std::move(body));
    response.set_header("Cache-Control", "public, max-age=" + std::to_string(max_age));
    response.set_header("Content-Type", "text/plain");
    return response;
}

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = make_store();
    }

    void TearDown() override {
        store_->cleanup();
    }

    std::unique_ptr<Store> make_store(std::uint32_t prune_threshold = 500) {
        StoreOptions options;
        options.cache = cache_;
        options.lock_backend = locks_;
        options.prune_threshold = prune_threshold;
        return std::make_unique<Store>(std::move(options));
    }

    std::optional<MetadataEntries> stored_entries(const http::Request& request) {
        auto value = cache_->get(store_->cache_key(request));
        if (!value) {
            return std::nullopt;
        }
        return MetadataEntries::decode(*value);
    }

    std::shared_ptr<backend::MemoryBackend> cache_ = std::make_shared<backend::MemoryBackend>();
    std::shared_ptr<lock::MemoryLockBackend> locks_ = std::make_shared<lock::MemoryLockBackend>();
    std::unique_ptr<Store> store_;
};

TEST_F(StoreTest, WriteThenLookup) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");

    store_->write(request, response);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->status(), 200u);
    EXPECT_EQ(cached->body(), "hello world");
    EXPECT_EQ(cached->header("Content-Type"), "text/plain");
}

TEST_F(StoreTest, LookupMissWhenNothingStored) {
    EXPECT_FALSE(store_->lookup(http::Request::create("/nothing")).has_value());
}

TEST_F(StoreTest, WriteReturnsSchemeIndependentKey) {
    auto https = http::Request::create("https://example.com/page");
    auto response = cacheable("secure");

    auto key = store_->write(https, response);

    EXPECT_EQ(key, store_->cache_key(http::Request::create("http://example.com/page")));
    auto cached = store_->lookup(http::Request::create("http://example.com/page"));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body(), "secure");
}

TEST_F(StoreTest, WriteWithoutMaxAgeIsRejected) {
    auto request = http::Request::create("/");
    http::Response response("no cache control");

    EXPECT_THROW(store_->write(request, response), WritePolicyError);
    EXPECT_FALSE(store_->lookup(request).has_value());
}

TEST_F(StoreTest, HugeMaxAgeIsStillCached) {
    auto request = http::Request::create("/forever");
    http::Response response("forever");
    response.set_header("Cache-Control", "max-age=9000000000000000000");

    store_->write(request, response);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body(), "forever");
    EXPECT_EQ(store_->content_store().fetch(response.header(kContentDigestHeader))->expires,
              http::kMaxDeltaSeconds);
}

TEST_F(StoreTest, ExpiresHeaderMakesResponseCacheable) {
    auto request = http::Request::create("/expires");
    http::Response response("expires body");
    response.set_header("Date", "Sun, 06 Nov 1994 08:49:37 GMT");
    response.set_header("Expires", "Sun, 06 Nov 1994 09:49:37 GMT");

    store_->write(request, response);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body(), "expires body");
    auto ttl = cache_->ttl(store_->cache_key(request));
    ASSERT_TRUE(ttl.has_value());
    EXPECT_GT(ttl->count(), 3500);
}

TEST_F(StoreTest, WriteMarksResponseWithDigest) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");

    store_->write(request, response);

    EXPECT_TRUE(response.has_header(kContentDigestHeader));
    EXPECT_EQ(response.header("Content-Length"), "11");

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->header(kContentDigestHeader), response.header(kContentDigestHeader));
}

TEST_F(StoreTest, AgeHeaderIsNotStored) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    response.set_header("Age", "42");

    store_->write(request, response);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_FALSE(cached->has_header("Age"));
}

TEST_F(StoreTest, RewritingIsIdempotent) {
    auto request = http::Request::create("/");
    auto first = cacheable("hello world");
    auto second = cacheable("hello world");

    store_->write(request, first);
    store_->write(request, second);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->status(), 200u);
    EXPECT_EQ(cached->body(), "hello world");
    EXPECT_EQ(stored_entries(request)->size(), 1u);
}

TEST_F(StoreTest, RestoredResponseIsNotStoredTwice) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    store_->write(request, response);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    auto deferred_before = cache_->get_stats().deferred;
    store_->write(request, *cached);

    EXPECT_EQ(cache_->get_stats().deferred, deferred_before);
    EXPECT_EQ(store_->lookup(request)->body(), "hello world");
}

TEST_F(StoreTest, IdenticalBodiesShareOneDigest) {
    auto a = http::Request::create("/a");
    auto b = http::Request::create("/b");
    auto response_a = cacheable("shared", 600);
    auto response_b = cacheable("shared", 86400);

    store_->write(a, response_a);
    store_->write(b, response_b);

    auto digest = response_a.header(kContentDigestHeader);
    EXPECT_EQ(digest, response_b.header(kContentDigestHeader));
    EXPECT_EQ(store_->content_store().fetch(digest)->expires, 86400);
}

TEST_F(StoreTest, VaryingResponsesAreSelectedByHeaders) {
    auto english = http::Request::create("/greeting");
    english.set_header("Accept-Language", "en");
    auto french = http::Request::create("/greeting");
    french.set_header("Accept-Language", "fr");

    auto hello = cacheable("hello");
    hello.set_header("Vary", "Accept-Language");
    store_->write(english, hello);

    ASSERT_TRUE(store_->lookup(english).has_value());
    EXPECT_EQ(store_->lookup(english)->body(), "hello");
    EXPECT_FALSE(store_->lookup(french).has_value());

    auto bonjour = cacheable("bonjour");
    bonjour.set_header("Vary", "Accept-Language");
    store_->write(french, bonjour);

    EXPECT_EQ(store_->lookup(english)->body(), "hello");
    EXPECT_EQ(store_->lookup(french)->body(), "bonjour");
    EXPECT_EQ(stored_entries(english)->size(), 2u);
}

TEST_F(StoreTest, VaryOnCookieComparesCookies) {
    auto alice = http::Request::create("/profile");
    alice.set_cookie("session", "alice");
    auto bob = http::Request::create("/profile");
    bob.set_cookie("session", "bob");

    auto response = cacheable("alice's profile");
    response.set_header("Vary", "Cookie");
    store_->write(alice, response);

    auto again = http::Request::create("/profile");
    again.set_cookie("session", "alice");
    EXPECT_TRUE(store_->lookup(again).has_value());
    EXPECT_FALSE(store_->lookup(bob).has_value());
}

TEST_F(StoreTest, VaryOnCookieHeaderSetDirectly) {
    auto alice = http::Request::create("/profile");
    alice.set_header("Cookie", "session=alice");

    auto response = cacheable("alice private");
    response.set_header("Vary", "Cookie");
    store_->write(alice, response);

    auto bob = http::Request::create("/profile");
    bob.set_header("Cookie", "session=bob");
    EXPECT_FALSE(store_->lookup(bob).has_value());

    auto anonymous = http::Request::create("/profile");
    EXPECT_FALSE(store_->lookup(anonymous).has_value());

    auto again = http::Request::create("/profile");
    again.set_header("Cookie", "session=alice");
    auto cached = store_->lookup(again);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body(), "alice private");
}

TEST_F(StoreTest, VaryStarNeverMatches) {
    auto english = http::Request::create("/negotiated");
    english.set_header("Accept-Language", "en");

    auto response = cacheable("anything");
    response.set_header("Vary", "*");
    store_->write(english, response);

    auto french = http::Request::create("/negotiated");
    french.set_header("Accept-Language", "fr");
    EXPECT_FALSE(store_->lookup(french).has_value());
    EXPECT_FALSE(store_->lookup(english).has_value());
}

TEST_F(StoreTest, NonVaryingRecordIsDroppedByVaryingWrite) {
    auto request = http::Request::create("/page");
    request.set_header("Accept-Encoding", "gzip");

    auto plain = cacheable("plain");
    store_->write(request, plain);
    auto entries = stored_entries(request);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_NE(entries->find(cache::kNonVaryingKey), nullptr);

    auto varying = cacheable("varying");
    varying.set_header("Vary", "Accept-Encoding");
    store_->write(request, varying);

    entries = stored_entries(request);
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->find(cache::kNonVaryingKey), nullptr);
    EXPECT_EQ(store_->lookup(request)->body(), "varying");
}

TEST_F(StoreTest, InvalidateRemovesEntryButKeepsContent) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    store_->write(request, response);

    store_->invalidate(request);

    EXPECT_FALSE(store_->lookup(request).has_value());
    EXPECT_TRUE(store_->content_store().fetch(response.header(kContentDigestHeader)).has_value());
}

TEST_F(StoreTest, PurgeReportsWhetherEntryExisted) {
    auto request = http::Request::create("http://example.com/page?b=2&a=1");
    auto response = cacheable("hello world");
    store_->write(request, response);

    EXPECT_TRUE(store_->purge("https://EXAMPLE.com/page?a=1&b=2"));
    EXPECT_FALSE(store_->lookup(request).has_value());
    EXPECT_FALSE(store_->purge("http://example.com/page?a=1&b=2"));
}

TEST_F(StoreTest, TagInvalidation) {
    auto tagged = http::Request::create("/tagged");
    auto other = http::Request::create("/other");

    auto tagged_response = cacheable("tagged");
    tagged_response.set_header("Cache-Tags", "foobar,other tag");
    store_->write(tagged, tagged_response);

    auto other_response = cacheable("other");
    other_response.set_header("Cache-Tags", "other tag");
    store_->write(other, other_response);

    EXPECT_TRUE(store_->invalidate_tags({"foobar"}));

    EXPECT_FALSE(store_->lookup(tagged).has_value());
    EXPECT_TRUE(store_->lookup(other).has_value());
}

TEST_F(StoreTest, TagsFromEveryHeaderOccurrence) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    response.add_header("Cache-Tags", "first");
    response.add_header("Cache-Tags", "second, third");
    store_->write(request, response);

    EXPECT_TRUE(store_->invalidate_tags({"third"}));
    EXPECT_FALSE(store_->lookup(request).has_value());
}

TEST_F(StoreTest, CustomTagHeader) {
    StoreOptions options;
    options.cache = cache_;
    options.lock_backend = locks_;
    options.cache_tags_header = "Surrogate-Key";
    Store store(std::move(options));

    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    response.set_header("Surrogate-Key", "product-1");
    store.write(request, response);

    EXPECT_TRUE(store.invalidate_tags({"product-1"}));
    EXPECT_FALSE(store.lookup(request).has_value());
}

TEST_F(StoreTest, InvalidTagReturnsFalse) {
    EXPECT_FALSE(store_->invalidate_tags({"bad@tag"}));
}

TEST_F(StoreTest, LockSequence) {
    auto request = http::Request::create("/");

    EXPECT_TRUE(store_->lock(request));
    EXPECT_TRUE(store_->is_locked(request));
    EXPECT_FALSE(store_->lock(request));
    EXPECT_TRUE(store_->unlock(request));
    EXPECT_FALSE(store_->is_locked(request));
    EXPECT_TRUE(store_->lock(request));
}

TEST_F(StoreTest, LocksAreSharedThroughBackendAndReleasedByCleanup) {
    auto request = http::Request::create("/");
    auto other = make_store();

    ASSERT_TRUE(store_->lock(request));
    EXPECT_FALSE(other->lock(request));
    EXPECT_FALSE(other->is_locked(request));

    store_->cleanup();
    EXPECT_FALSE(store_->is_locked(request));
    EXPECT_TRUE(other->lock(request));
    other->cleanup();
}

TEST_F(StoreTest, ExpiredLockUnlocksWithFalse) {
    auto request = http::Request::create("/");
    ASSERT_TRUE(store_->lock(request));
    locks_->expire(store_->cache_key(request));

    EXPECT_FALSE(store_->unlock(request));
    EXPECT_FALSE(store_->is_locked(request));
}

TEST_F(StoreTest, UnlockWithoutLockIsFalse) {
    EXPECT_FALSE(store_->unlock(http::Request::create("/")));
}

TEST_F(StoreTest, AutoPruneRunsEveryThresholdWrites) {
    auto store = make_store(5);

    for (int i = 0; i < 21; ++i) {
        auto request = http::Request::create("/item/" + std::to_string(i));
        auto response = cacheable("body " + std::to_string(i));
        store->write(request, response);
    }

    EXPECT_EQ(cache_->get_stats().prunes, 3u);
    EXPECT_EQ(cache_->get(std::string(kCounterKey)), "0");
}

TEST_F(StoreTest, AutoPruneCounterPersistsBetweenInstances) {
    for (int i = 0; i < 3; ++i) {
        auto store = make_store(5);
        auto request = http::Request::create("/item/" + std::to_string(i));
        auto response = cacheable("body");
        store->write(request, response);
    }

    EXPECT_EQ(cache_->get(std::string(kCounterKey)), "3");
}

TEST_F(StoreTest, ZeroThresholdNeverPrunes) {
    auto store = make_store(0);

    for (int i = 0; i < 21; ++i) {
        auto request = http::Request::create("/item/" + std::to_string(i));
        auto response = cacheable("body");
        store->write(request, response);
    }

    EXPECT_EQ(cache_->get_stats().prunes, 0u);
    EXPECT_FALSE(cache_->get(std::string(kCounterKey)).has_value());
}

TEST_F(StoreTest, PruneSkippedWhileAnotherPassHoldsLock) {
    auto holder = locks_->create_lock(std::string(kPruneLockName));
    ASSERT_TRUE(holder->acquire());

    store_->prune();
    EXPECT_EQ(cache_->get_stats().prunes, 0u);

    holder->release();
    store_->prune();
    EXPECT_EQ(cache_->get_stats().prunes, 1u);
    EXPECT_FALSE(locks_->is_held(std::string(kPruneLockName)));
}

TEST_F(StoreTest, ClearRemovesEverything) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    store_->write(request, response);

    store_->clear();

    EXPECT_FALSE(store_->lookup(request).has_value());
    EXPECT_FALSE(locks_->is_held(std::string(kCleanupLockName)));
}

TEST_F(StoreTest, ClearSkippedWhileAnotherPassHoldsLock) {
    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    store_->write(request, response);

    auto holder = locks_->create_lock(std::string(kCleanupLockName));
    ASSERT_TRUE(holder->acquire());
    store_->clear();
    holder->release();

    EXPECT_TRUE(store_->lookup(request).has_value());
}

TEST_F(StoreTest, InlineContentWhenDigestsDisabled) {
    StoreOptions options;
    options.cache = cache_;
    options.lock_backend = locks_;
    options.generate_content_digests = false;
    Store store(std::move(options));

    auto request = http::Request::create("/");
    auto response = cacheable("inline body");
    store.write(request, response);

    EXPECT_FALSE(response.has_header(kContentDigestHeader));
    auto cached = store.lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body(), "inline body");
}

TEST_F(StoreTest, GzipStoredBodyIsDecodedForPlainClients) {
    StoreOptions options;
    options.cache = cache_;
    options.lock_backend = locks_;
    options.gzip_level = 9;
    Store store(std::move(options));

    auto request = http::Request::create("/");
    auto response = cacheable(std::string(2048, 'z'));
    store.write(request, response);

    auto plain = store.lookup(request);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->body(), std::string(2048, 'z'));

    auto gzip_request = http::Request::create("/");
    gzip_request.set_header("Accept-Encoding", "gzip");
    auto encoded = store.lookup(gzip_request);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->header("Content-Encoding"), "gzip");
    EXPECT_LT(encoded->body().size(), 2048u);
}

TEST_F(StoreTest, RemovedFileIsMiss) {
    std::random_device rd;
    auto path = fs::temp_directory_path() / ("httpstash_store_" + std::to_string(rd()) + ".bin");
    std::ofstream(path, std::ios::binary) << "file body";

    auto request = http::Request::create("/download");
    auto response = http::Response::from_file(path);
    response.set_header("Cache-Control", "max-age=60");
    store_->write(request, response);

    auto cached = store_->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->is_file());

    fs::remove(path);
    EXPECT_FALSE(store_->lookup(request).has_value());
}

TEST(StoreMockTest, AutoPruneTakesPruneLockEachPass) {
    auto cache = std::make_shared<backend::MemoryBackend>();
    auto locks = std::make_shared<test::MockLockBackend>();

    EXPECT_CALL(*locks, create_lock(std::string(kPruneLockName))).Times(3).WillRepeatedly([](const std::string& name) {
        auto lock = std::make_unique<test::MockLock>(name);
        EXPECT_CALL(*lock, acquire()).WillOnce(Return(true));
        EXPECT_CALL(*lock, release()).Times(1);
        return lock;
    });

    StoreOptions options;
    options.cache = cache;
    options.lock_backend = locks;
    options.prune_threshold = 5;
    Store store(std::move(options));

    for (int i = 0; i < 21; ++i) {
        auto request = http::Request::create("/item/" + std::to_string(i));
        auto response = cacheable("body");
        store.write(request, response);
    }

    EXPECT_EQ(cache->get_stats().prunes, 3u);
}

TEST(StoreMockTest, FailedMetadataWriteThrowsStorageError) {
    auto cache = std::make_shared<test::MockCacheBackend>();
    EXPECT_CALL(*cache, capabilities()).WillOnce(Return(backend::Capability::none));
    EXPECT_CALL(*cache, get(_)).WillRepeatedly(Return(std::nullopt));
    EXPECT_CALL(*cache, save_deferred(::testing::StartsWith("en"), _, _, _)).WillOnce(Return(true));
    EXPECT_CALL(*cache, save_deferred(::testing::StartsWith("md"), _, _, _)).WillOnce(Return(false));
    EXPECT_CALL(*cache, commit()).Times(0);

    StoreOptions options;
    options.cache = cache;
    options.lock_backend = std::make_shared<lock::MemoryLockBackend>();
    options.prune_threshold = 0;
    Store store(std::move(options));

    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    EXPECT_THROW(store.write(request, response), StorageError);
}

TEST(StoreMockTest, ReservedCharacterTagsAreDropped) {
    auto cache = std::make_shared<test::MockCacheBackend>();
    EXPECT_CALL(*cache, capabilities()).WillOnce(Return(backend::Capability::tags));
    EXPECT_CALL(*cache, get(_)).WillRepeatedly(Return(std::nullopt));
    EXPECT_CALL(*cache, save_deferred(::testing::StartsWith("en"), _, _, _)).WillOnce(Return(true));
    EXPECT_CALL(*cache, save_deferred(::testing::StartsWith("md"), _, _,
                                      std::vector<std::string>{"good", "also-good"}))
        .WillOnce(Return(true));
    EXPECT_CALL(*cache, commit()).WillOnce(Return(true));

    StoreOptions options;
    options.cache = cache;
    options.lock_backend = std::make_shared<lock::MemoryLockBackend>();
    options.prune_threshold = 0;
    Store store(std::move(options));

    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    response.set_header("Cache-Tags", "good, bad/tag, user@host, also-good");
    store.write(request, response);
}

TEST(StoreCapabilityTest, BackendWithoutCapabilities) {
    auto cache = std::make_shared<backend::MemoryBackend>(backend::Capability::none);
    StoreOptions options;
    options.cache = cache;
    options.lock_backend = std::make_shared<lock::MemoryLockBackend>();
    options.prune_threshold = 1;
    Store store(std::move(options));

    EXPECT_THROW(store.invalidate_tags({"foobar"}), ConfigError);
    EXPECT_NO_THROW(store.prune());

    for (int i = 0; i < 5; ++i) {
        auto request = http::Request::create("/item/" + std::to_string(i));
        auto response = cacheable("body");
        EXPECT_NO_THROW(store.write(request, response));
    }
    EXPECT_EQ(cache->get_stats().prunes, 0u);
}

TEST(StoreConfigTest, MissingCacheAndDirectoryIsConfigError) {
    StoreOptions options;
    options.lock_backend = std::make_shared<lock::MemoryLockBackend>();
    EXPECT_THROW(Store store(options), ConfigError);
}

TEST(StoreConfigTest, MissingLockBackendAndDirectoryIsConfigError) {
    StoreOptions options;
    options.cache = std::make_shared<backend::MemoryBackend>();
    EXPECT_THROW(Store store(options), ConfigError);
}

TEST(StoreConfigTest, OutOfRangeOptionsAreConfigErrors) {
    StoreOptions options;
    options.cache = std::make_shared<backend::MemoryBackend>();
    options.lock_backend = std::make_shared<lock::MemoryLockBackend>();

    options.gzip_level = 10;
    EXPECT_THROW(Store store(options), ConfigError);

    options.gzip_level = 0;
    options.cache_tags_header.clear();
    EXPECT_THROW(Store store(options), ConfigError);
}

TEST(StoreConfigTest, FromSettingsCopiesEveryField) {
    config::StoreSettings settings;
    settings.cache_directory = "/tmp/cache";
    settings.prune_threshold = 7;
    settings.cache_tags_header = "Surrogate-Key";
    settings.generate_content_digests = false;
    settings.gzip_level = 4;

    auto options = StoreOptions::from_settings(settings);

    EXPECT_EQ(options.cache_directory, "/tmp/cache");
    EXPECT_EQ(options.prune_threshold, 7u);
    EXPECT_EQ(options.cache_tags_header, "Surrogate-Key");
    EXPECT_FALSE(options.generate_content_digests);
    EXPECT_EQ(options.gzip_level, 4);
    EXPECT_FALSE(options.cache);
    EXPECT_FALSE(options.lock_backend);
}

class StoreDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        directory_ = fs::temp_directory_path() / ("httpstash_store_dir_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(directory_, ec);
    }

    std::unique_ptr<Store> make_store() {
        StoreOptions options;
        options.cache_directory = directory_.string();
        return std::make_unique<Store>(std::move(options));
    }

    fs::path directory_;
};

TEST_F(StoreDirectoryTest, DefaultBackendsShareDirectory) {
    auto writer = make_store();
    auto reader = make_store();

    auto request = http::Request::create("http://example.com/");
    auto response = cacheable("hello world");
    response.set_header("Cache-Tags", "home");
    writer->write(request, response);

    auto cached = reader->lookup(request);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body(), "hello world");

    EXPECT_TRUE(writer->lock(request));
    EXPECT_FALSE(reader->lock(request));
    writer->cleanup();
    EXPECT_TRUE(reader->lock(request));
    reader->cleanup();

    EXPECT_TRUE(reader->invalidate_tags({"home"}));
    EXPECT_FALSE(writer->lookup(request).has_value());

    EXPECT_TRUE(fs::is_directory(directory_ / "http_cache"));
    EXPECT_TRUE(fs::is_directory(directory_ / "locks"));
}

TEST_F(StoreDirectoryTest, PruneAndClearOnDisk) {
    auto store = make_store();

    auto request = http::Request::create("/");
    auto response = cacheable("hello world");
    store->write(request, response);

    store->prune();
    EXPECT_TRUE(store->lookup(request).has_value());

    store->clear();
    EXPECT_FALSE(store->lookup(request).has_value());
}

} // namespace
} // namespace httpstash::store
