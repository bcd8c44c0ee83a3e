/*
 * catalog_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file catalog_cache.hpp
 * @brief Shared cache of resolved unit catalogs
 * @date 2024-4-12
 */

#ifndef QUANTA_UNITS_CATALOG_CACHE_HPP
#define QUANTA_UNITS_CATALOG_CACHE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "quanta/units/catalog.hpp"
#include "quanta/units/unit_error.hpp"

namespace quanta::units {

/**
 * @brief Loads each catalog source once and shares the immutable result.
 *
 * Concurrent requests for the same source wait on a single load. Catalogs are
 * published only when fully built; a failed load is reported to every waiter
 * and then forgotten so the next request retries.
 */
class CatalogCache {
public:
    using CatalogPtr = std::shared_ptr<const UnitCatalog>;
    using LoadResult = UnitResult<CatalogPtr>;
    using Loader = std::function<UnitResult<UnitCatalog>(const std::string&)>;

    /**
     * @brief Constructs a cache that resolves sources with @p loader.
     *
     * @param loader Turns a source identifier into a catalog. The default
     * treats the identifier as a JSON file path.
     */
    explicit CatalogCache(Loader loader = defaultLoader());

    CatalogCache(const CatalogCache&) = delete;
    auto operator=(const CatalogCache&) -> CatalogCache& = delete;

    /**
     * @brief Returns the catalog for @p source, loading it if needed.
     *
     * @param source The source identifier passed to the loader.
     * @return The shared catalog, or the loader's error.
     */
    auto load(const std::string& source) -> LoadResult;

    /**
     * @brief Runs load() on a background task.
     *
     * @param source The source identifier passed to the loader.
     * @return A future for the result of load().
     */
    auto loadAsync(const std::string& source) -> std::future<LoadResult>;

    /**
     * @brief Non-blocking lookup.
     *
     * @return The catalog if its load has completed successfully, otherwise
     * nullptr.
     */
    [[nodiscard]] auto peek(const std::string& source) const -> CatalogPtr;

    /**
     * @brief Forgets @p source. Holders of the catalog keep their copy.
     */
    void invalidate(const std::string& source);

    void clear();

    [[nodiscard]] auto size() const -> size_t;

    /**
     * @brief Retrieves cache statistics.
     *
     * @return A pair containing hit count and miss count.
     */
    [[nodiscard]] auto getStatistics() const -> std::pair<size_t, size_t>;

    [[nodiscard]] static auto defaultLoader() -> Loader;

private:
    struct Entry {
        std::shared_future<LoadResult> result;
        std::uint64_t generation;
    };

    void forget(const std::string& source, std::uint64_t generation);

    Loader loader_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
    std::uint64_t nextGeneration_ = 0;
    std::atomic<size_t> hitCount_{0};
    std::atomic<size_t> missCount_{0};
};

}  // namespace quanta::units

#endif  // QUANTA_UNITS_CATALOG_CACHE_HPP
