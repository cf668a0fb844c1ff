/**
 * @file CopyPlan.cpp
 * @brief Plan compilation
 */

#include "PropSync/CopyPlan.hpp"

#include <utility>

namespace propsync {

std::string_view to_string(PlanKind kind) noexcept {
    switch (kind) {
        case PlanKind::Replace: return "Replace";
        case PlanKind::MergeCollections: return "MergeCollections";
    }
    return "Unknown";
}

CopyPlan::CopyPlan(const Shape& shape, PlanKind kind, ExclusionSet excluded)
    : type_(&shape.type())
    , kind_(kind)
    , excluded_(std::move(excluded))
{
    steps_.reserve(shape.size());

    for (const auto& member : shape.members()) {
        if (excluded_.contains(member.name)) {
            continue;
        }

        const bool merges = kind_ == PlanKind::MergeCollections &&
                            member.kind == MemberKind::MergeableOrderedCollection;
        steps_.push_back(Step{member.name, merges, merges ? member.merge : member.assign});
    }
}

std::vector<std::string_view> CopyPlan::member_names() const {
    std::vector<std::string_view> names;
    names.reserve(steps_.size());
    for (const auto& step : steps_) {
        names.push_back(step.name);
    }
    return names;
}

} // namespace propsync
