/**
 * @file CopyPlan.hpp
 * @brief Precompiled member copy procedure for one type
 *
 * A CopyPlan is built from a Shape, a PlanKind and an ExclusionSet and never
 * changes afterwards. Applying it runs one precomputed step per included
 * member, with no name lookup and no classification on the hot path.
 */

#ifndef PROPSYNC_COPY_PLAN_HPP
#define PROPSYNC_COPY_PLAN_HPP

#include "Shape.hpp"
#include "ExclusionSet.hpp"
#include "detail/TypeInfo.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace propsync {

enum class PlanKind {
    Replace,            ///< Every member is assigned, collections included
    MergeCollections    ///< Bindable list members are merged in place
};

[[nodiscard]] std::string_view to_string(PlanKind kind) noexcept;

class CopyPlan {
public:
    /**
     * @brief One compiled member action
     *
     * merges is true when the action is the in-place collection merge.
     */
    struct Step {
        std::string name;
        bool merges = false;
        detail::MemberInfo::Copier action;
    };

    /**
     * @brief Compile a plan
     *
     * Members named in excluded are dropped; names that are not members of
     * the shape have no effect. An empty result is a valid no-op plan.
     */
    CopyPlan(const Shape& shape, PlanKind kind, ExclusionSet excluded);

    CopyPlan(const CopyPlan&) = delete;
    CopyPlan& operator=(const CopyPlan&) = delete;

    /**
     * @brief Copy every included member from source onto target
     *
     * Both pointers must address live objects of the plan's type. The
     * identity check and null checks are the caller's job.
     */
    void apply(void* target, const void* source) const {
        for (const auto& step : steps_) {
            step.action(target, source);
        }
    }

    [[nodiscard]] const detail::TypeInfo& type() const noexcept { return *type_; }
    [[nodiscard]] PlanKind kind() const noexcept { return kind_; }
    [[nodiscard]] const ExclusionSet& excluded() const noexcept { return excluded_; }

    [[nodiscard]] const std::vector<Step>& steps() const noexcept { return steps_; }
    [[nodiscard]] bool empty() const noexcept { return steps_.empty(); }

    [[nodiscard]] std::vector<std::string_view> member_names() const;

private:
    const detail::TypeInfo* type_;
    PlanKind kind_;
    ExclusionSet excluded_;
    std::vector<Step> steps_;
};

} // namespace propsync

#endif // PROPSYNC_COPY_PLAN_HPP
