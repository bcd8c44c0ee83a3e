#include "catalog_cache.hpp"

#include <chrono>
#include <exception>
#include <mutex>

#include <spdlog/spdlog.h>

namespace quanta::units {

CatalogCache::CatalogCache(Loader loader) : loader_(std::move(loader)) {}

auto CatalogCache::defaultLoader() -> Loader {
    return [](const std::string& source) {
        return UnitCatalog::fromFile(source);
    };
}

auto CatalogCache::load(const std::string& source) -> LoadResult {
    {
        std::shared_lock lock(mutex_);
        if (auto it = entries_.find(source); it != entries_.end()) {
            hitCount_++;
            auto pending = it->second.result;
            lock.unlock();
            return pending.get();
        }
    }

    std::promise<LoadResult> promise;
    std::uint64_t generation = 0;
    {
        std::unique_lock lock(mutex_);
        if (auto it = entries_.find(source); it != entries_.end()) {
            hitCount_++;
            auto pending = it->second.result;
            lock.unlock();
            return pending.get();
        }
        missCount_++;
        generation = nextGeneration_++;
        entries_.emplace(source,
                         Entry{promise.get_future().share(), generation});
    }

    spdlog::debug("Loading units map {}", source);
    LoadResult result = makeUnitError(UnitErrorCode::DataIntegrityError,
                                      "units map " + source + " not loaded");
    try {
        auto loaded = loader_(source);
        if (loaded) {
            result = std::make_shared<const UnitCatalog>(std::move(*loaded));
        } else {
            result = type::unexpected<UnitError>(loaded.error());
        }
    } catch (const std::exception& e) {
        spdlog::error("Load failed for units map {}: {}", source, e.what());
        result = makeUnitError(UnitErrorCode::DataIntegrityError,
                               "units map " + source + ": " + e.what());
    } catch (...) {
        spdlog::error("Load failed for units map {}: unknown exception",
                      source);
        result = makeUnitError(UnitErrorCode::DataIntegrityError,
                               "units map " + source +
                                   ": unknown exception");
    }

    if (!result) {
        forget(source, generation);
    } else {
        spdlog::info("Cached units map {} ({} units)", source,
                     (*result)->size());
    }
    promise.set_value(result);
    return result;
}

auto CatalogCache::loadAsync(const std::string& source)
    -> std::future<LoadResult> {
    return std::async(std::launch::async,
                      [this, source]() { return load(source); });
}

auto CatalogCache::peek(const std::string& source) const -> CatalogPtr {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(source);
    if (it == entries_.end()) {
        return nullptr;
    }
    const auto& pending = it->second.result;
    if (pending.wait_for(std::chrono::seconds(0)) !=
        std::future_status::ready) {
        return nullptr;
    }
    const auto& result = pending.get();
    return result ? *result : nullptr;
}

void CatalogCache::invalidate(const std::string& source) {
    std::unique_lock lock(mutex_);
    if (entries_.erase(source) > 0) {
        spdlog::debug("Invalidated units map {}", source);
    }
}

void CatalogCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

auto CatalogCache::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

auto CatalogCache::getStatistics() const -> std::pair<size_t, size_t> {
    return {hitCount_.load(), missCount_.load()};
}

void CatalogCache::forget(const std::string& source, std::uint64_t generation) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(source);
    // A newer load may have replaced the entry after an invalidate().
    if (it != entries_.end() && it->second.generation == generation) {
        entries_.erase(it);
        spdlog::warn("Dropped units map {} after a failed load", source);
    }
}

}  // namespace quanta::units
