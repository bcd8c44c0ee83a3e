#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "quanta/units/catalog_cache.hpp"
#include "test_units_map.hpp"

using namespace quanta::units;
using ::testing::MockFunction;
using ::testing::Return;

namespace {

auto loadTestMap() -> UnitResult<UnitCatalog> {
    return UnitCatalog::fromJsonText(test::K_TEST_UNITS_MAP);
}

auto loadFailure() -> UnitResult<UnitCatalog> {
    return makeUnitError(UnitErrorCode::DataIntegrityError, "unreachable");
}

}  // namespace

class CatalogCacheTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    MockFunction<UnitResult<UnitCatalog>(const std::string&)> loader;
};

TEST_F(CatalogCacheTest, LoadsOnceAndShares) {
    EXPECT_CALL(loader, Call("units.json")).WillOnce(Return(loadTestMap()));
    CatalogCache cache(loader.AsStdFunction());

    auto first = cache.load("units.json");
    auto second = cache.load("units.json");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->get(), second->get());
    EXPECT_EQ((*first)->size(), test::K_TEST_UNIT_COUNT);
    EXPECT_EQ(cache.size(), 1U);

    auto [hits, misses] = cache.getStatistics();
    EXPECT_EQ(hits, 1U);
    EXPECT_EQ(misses, 1U);
}

TEST_F(CatalogCacheTest, SourcesAreIndependent) {
    EXPECT_CALL(loader, Call("a.json")).WillOnce(Return(loadTestMap()));
    EXPECT_CALL(loader, Call("b.json")).WillOnce(Return(loadTestMap()));
    CatalogCache cache(loader.AsStdFunction());

    auto a = cache.load("a.json");
    auto b = cache.load("b.json");
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->get(), b->get());
    EXPECT_EQ(cache.size(), 2U);
}

TEST_F(CatalogCacheTest, FailureIsNotCached) {
    EXPECT_CALL(loader, Call("units.json"))
        .WillOnce(Return(loadFailure()))
        .WillOnce(Return(loadTestMap()));
    CatalogCache cache(loader.AsStdFunction());

    auto failed = cache.load("units.json");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, UnitErrorCode::DataIntegrityError);
    EXPECT_EQ(cache.size(), 0U);
    EXPECT_EQ(cache.peek("units.json"), nullptr);

    auto retried = cache.load("units.json");
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(cache.peek("units.json"), *retried);
}

TEST_F(CatalogCacheTest, LoaderExceptionBecomesError) {
    EXPECT_CALL(loader, Call("units.json"))
        .WillOnce([](const std::string&) -> UnitResult<UnitCatalog> {
            throw std::runtime_error("disk on fire");
        });
    CatalogCache cache(loader.AsStdFunction());

    auto result = cache.load("units.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, UnitErrorCode::DataIntegrityError);
    EXPECT_THAT(result.error().message, ::testing::HasSubstr("disk on fire"));
    EXPECT_EQ(cache.size(), 0U);
}

TEST_F(CatalogCacheTest, NonStandardExceptionIsRetried) {
    EXPECT_CALL(loader, Call("units.json"))
        .WillOnce([](const std::string&) -> UnitResult<UnitCatalog> {
            throw 42;
        })
        .WillOnce(Return(loadTestMap()));
    CatalogCache cache(loader.AsStdFunction());

    auto failed = cache.load("units.json");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, UnitErrorCode::DataIntegrityError);
    EXPECT_EQ(cache.size(), 0U);
    EXPECT_EQ(cache.peek("units.json"), nullptr);

    auto retried = cache.load("units.json");
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ((*retried)->size(), test::K_TEST_UNIT_COUNT);
}

TEST_F(CatalogCacheTest, PeekIsNonBlocking) {
    std::promise<void> started;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    EXPECT_CALL(loader, Call("slow.json"))
        .WillOnce([&](const std::string&) {
            started.set_value();
            releaseFuture.wait();
            return loadTestMap();
        });
    CatalogCache cache(loader.AsStdFunction());

    EXPECT_EQ(cache.peek("slow.json"), nullptr);
    auto pending = cache.loadAsync("slow.json");
    started.get_future().wait();
    EXPECT_EQ(cache.peek("slow.json"), nullptr);
    EXPECT_EQ(cache.size(), 1U);

    release.set_value();
    auto result = pending.get();
    ASSERT_TRUE(result.has_value());
    auto peeked = cache.peek("slow.json");
    ASSERT_NE(peeked, nullptr);
    EXPECT_EQ(peeked, *result);
}

TEST_F(CatalogCacheTest, ConcurrentRequestsShareOneLoad) {
    std::atomic<int> calls{0};
    CatalogCache cache([&calls](const std::string&) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return loadTestMap();
    });

    constexpr int K_REQUESTS = 8;
    std::vector<std::future<CatalogCache::LoadResult>> futures;
    futures.reserve(K_REQUESTS);
    for (int i = 0; i < K_REQUESTS; ++i) {
        futures.push_back(cache.loadAsync("shared.json"));
    }

    CatalogCache::CatalogPtr first;
    for (auto& future : futures) {
        auto result = future.get();
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ((*result)->size(), test::K_TEST_UNIT_COUNT);
        if (!first) {
            first = *result;
        }
        EXPECT_EQ(first, *result);
    }
    EXPECT_EQ(calls.load(), 1);

    auto [hits, misses] = cache.getStatistics();
    EXPECT_EQ(hits + misses, static_cast<size_t>(K_REQUESTS));
    EXPECT_EQ(misses, 1U);
}

TEST_F(CatalogCacheTest, InvalidateForcesReload) {
    EXPECT_CALL(loader, Call("units.json"))
        .Times(2)
        .WillRepeatedly([](const std::string&) { return loadTestMap(); });
    CatalogCache cache(loader.AsStdFunction());

    auto first = cache.load("units.json");
    ASSERT_TRUE(first.has_value());
    cache.invalidate("units.json");
    EXPECT_EQ(cache.size(), 0U);
    EXPECT_EQ(cache.peek("units.json"), nullptr);

    auto second = cache.load("units.json");
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->get(), second->get());
    // The invalidated catalog stays usable by its holders.
    EXPECT_EQ((*first)->size(), test::K_TEST_UNIT_COUNT);
}

TEST_F(CatalogCacheTest, Clear) {
    EXPECT_CALL(loader, Call(::testing::_))
        .Times(2)
        .WillRepeatedly([](const std::string&) { return loadTestMap(); });
    CatalogCache cache(loader.AsStdFunction());

    ASSERT_TRUE(cache.load("a.json").has_value());
    ASSERT_TRUE(cache.load("b.json").has_value());
    EXPECT_EQ(cache.size(), 2U);
    cache.clear();
    EXPECT_EQ(cache.size(), 0U);
    EXPECT_EQ(cache.peek("a.json"), nullptr);
}

TEST_F(CatalogCacheTest, DefaultLoaderReadsFiles) {
    CatalogCache cache;
    auto missing = cache.load("/nonexistent/quanta/units.ucum.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, UnitErrorCode::DataIntegrityError);
    EXPECT_EQ(cache.size(), 0U);
}
