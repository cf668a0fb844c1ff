/**
 * @file PlanCache.cpp
 * @brief Double-checked shape and plan construction
 */

#include "PropSync/PlanCache.hpp"
#include "PropSync/detail/Log.hpp"

#include <mutex>
#include <utility>

namespace propsync {

PlanCache& PlanCache::instance() {
    static PlanCache cache;
    return cache;
}

std::size_t PlanCache::TypeEntry::plan_count() const noexcept {
    return (replace ? 1u : 0u) + (merge ? 1u : 0u) +
           replace_excluding.size() + merge_excluding.size();
}

std::shared_ptr<const Shape> PlanCache::shape(const detail::TypeInfo& type) {
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(&type);
        if (it != entries_.end() && it->second.shape) [[likely]] {
            return it->second.shape;
        }
    }

    std::unique_lock lock(mutex_);
    auto& entry = entries_[&type];
    if (!entry.shape) {
        entry.shape = std::make_shared<const Shape>(Shape::build(type));
    }
    return entry.shape;
}

PlanCache::PlanPtr PlanCache::find(const TypeEntry& entry, PlanKind kind, const ExclusionSet& excluded) {
    if (excluded.empty()) {
        return kind == PlanKind::Replace ? entry.replace : entry.merge;
    }

    const auto& table = kind == PlanKind::Replace ? entry.replace_excluding : entry.merge_excluding;
    auto it = table.find(excluded.key());
    return it != table.end() ? it->second : nullptr;
}

void PlanCache::store(TypeEntry& entry, PlanKind kind, const ExclusionSet& excluded, PlanPtr plan) {
    if (excluded.empty()) {
        (kind == PlanKind::Replace ? entry.replace : entry.merge) = std::move(plan);
        return;
    }

    auto& table = kind == PlanKind::Replace ? entry.replace_excluding : entry.merge_excluding;
    table.emplace(excluded.key(), std::move(plan));
}

std::shared_ptr<const CopyPlan> PlanCache::get_plan(const detail::TypeInfo& type,
                                                    PlanKind kind,
                                                    const ExclusionSet& excluded) {
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(&type);
        if (it != entries_.end()) {
            if (auto plan = find(it->second, kind, excluded)) [[likely]] {
                return plan;
            }
        }
    }

    std::unique_lock lock(mutex_);
    auto& entry = entries_[&type];
    if (auto plan = find(entry, kind, excluded)) {
        return plan;
    }

    if (!entry.shape) {
        entry.shape = std::make_shared<const Shape>(Shape::build(type));
    }

    auto plan = std::make_shared<const CopyPlan>(*entry.shape, kind, excluded);
    builds_.fetch_add(1, std::memory_order_relaxed);
    PROPSYNC_DEBUG("built ", to_string(kind), " plan for ", type.name,
                   " excluding [", excluded.key(), "] with ", plan->steps().size(), " steps");

    store(entry, kind, excluded, plan);
    return plan;
}

std::size_t PlanCache::plan_count() const {
    std::shared_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& [type, entry] : entries_) {
        count += entry.plan_count();
    }
    return count;
}

std::size_t PlanCache::plan_count(const detail::TypeInfo& type) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(&type);
    return it != entries_.end() ? it->second.plan_count() : 0;
}

} // namespace propsync
