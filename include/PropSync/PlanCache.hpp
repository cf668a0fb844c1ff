/**
 * @file PlanCache.hpp
 * @brief Process-wide cache of shapes and copy plans
 *
 * This file implements the PlanCache singleton which provides:
 * - One memoized Shape per registered type
 * - One plan per (type, kind) without exclusions
 * - One plan per (type, kind, exclusion key) with exclusions
 *
 * Entries are built on first request and live for the process lifetime.
 */

#ifndef PROPSYNC_PLAN_CACHE_HPP
#define PROPSYNC_PLAN_CACHE_HPP

#include "CopyPlan.hpp"
#include "ExclusionSet.hpp"
#include "Shape.hpp"
#include "detail/TypeInfo.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace propsync {

/**
 * @brief Singleton cache of shapes and copy plans
 *
 * Lookups take a shared lock, so cached plans are read concurrently.
 * A miss takes the exclusive lock, checks again, then builds and inserts,
 * so concurrent requests for one key build exactly one plan and all
 * callers receive that same instance.
 */
class PlanCache {
public:
    static PlanCache& instance();

    PlanCache(const PlanCache&) = delete;
    PlanCache& operator=(const PlanCache&) = delete;
    PlanCache(PlanCache&&) = delete;
    PlanCache& operator=(PlanCache&&) = delete;

    /**
     * @brief Memoized shape of a registered type
     */
    std::shared_ptr<const Shape> shape(const detail::TypeInfo& type);

    /**
     * @brief Cached plan for (type, kind, excluded), built on first request
     *
     * An empty exclusion set selects the per-type plan of that kind.
     */
    std::shared_ptr<const CopyPlan> get_plan(const detail::TypeInfo& type,
                                             PlanKind kind,
                                             const ExclusionSet& excluded = {});

    /**
     * @brief Number of cached plans, over all types
     */
    std::size_t plan_count() const;

    /**
     * @brief Number of cached plans for one type
     */
    std::size_t plan_count(const detail::TypeInfo& type) const;

    /**
     * @brief Number of plans built since process start
     */
    std::size_t build_count() const noexcept {
        return builds_.load(std::memory_order_relaxed);
    }

private:
    PlanCache() = default;
    ~PlanCache() = default;

    using PlanPtr = std::shared_ptr<const CopyPlan>;

    struct TypeEntry {
        std::shared_ptr<const Shape> shape;
        PlanPtr replace;
        PlanPtr merge;
        detail::TransparentStringMap<PlanPtr> replace_excluding;
        detail::TransparentStringMap<PlanPtr> merge_excluding;

        [[nodiscard]] std::size_t plan_count() const noexcept;
    };

    static PlanPtr find(const TypeEntry& entry, PlanKind kind, const ExclusionSet& excluded);
    static void store(TypeEntry& entry, PlanKind kind, const ExclusionSet& excluded, PlanPtr plan);

    mutable std::shared_mutex mutex_;
    std::unordered_map<const detail::TypeInfo*, TypeEntry> entries_;
    std::atomic<std::size_t> builds_{0};
};

} // namespace propsync

#endif // PROPSYNC_PLAN_CACHE_HPP
