/**
 * @file Shape.hpp
 * @brief Copyable member list of a registered type
 *
 * A Shape is derived once per type from its registration: the members that
 * are both readable and writable, in registration order, each classified as
 * ScalarOrReference (replaced on copy) or MergeableOrderedCollection
 * (merged in place by the collection-aware copier).
 */

#ifndef PROPSYNC_SHAPE_HPP
#define PROPSYNC_SHAPE_HPP

#include "detail/TypeInfo.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace propsync {

enum class MemberKind {
    ScalarOrReference,
    MergeableOrderedCollection
};

/**
 * @brief One copyable member of a shape
 *
 * assign replaces the target's value with the source's; merge is only set
 * for MergeableOrderedCollection members.
 */
struct MemberDescriptor {
    std::string name;
    MemberKind kind = MemberKind::ScalarOrReference;
    detail::MemberInfo::Copier assign;
    detail::MemberInfo::Copier merge;
};

class Shape {
public:
    Shape(const detail::TypeInfo& type, std::vector<MemberDescriptor> members);

    /**
     * @brief Derive the shape of a registered type
     *
     * Read-only and write-only members are left out. Has no side effects;
     * callers memoize the result through PlanCache.
     */
    [[nodiscard]] static Shape build(const detail::TypeInfo& type);

    [[nodiscard]] const detail::TypeInfo& type() const noexcept { return *type_; }
    [[nodiscard]] std::string_view type_name() const noexcept { return type_->name; }

    [[nodiscard]] const std::vector<MemberDescriptor>& members() const noexcept { return members_; }
    [[nodiscard]] std::size_t size() const noexcept { return members_.size(); }
    [[nodiscard]] bool empty() const noexcept { return members_.empty(); }

    [[nodiscard]] const MemberDescriptor* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    /**
     * @throws PropertyNotFoundError if name is not a copyable member
     */
    [[nodiscard]] const MemberDescriptor& at(std::string_view name) const;

    /**
     * @brief Member names in copy order
     */
    [[nodiscard]] std::vector<std::string_view> names() const;

private:
    const detail::TypeInfo* type_;
    std::vector<MemberDescriptor> members_;
};

} // namespace propsync

#endif // PROPSYNC_SHAPE_HPP
