/**
 * @file Shape.cpp
 * @brief Shape derivation from registered member metadata
 */

#include "PropSync/Shape.hpp"
#include "PropSync/detail/Exceptions.hpp"
#include "PropSync/detail/Log.hpp"

#include <utility>

namespace propsync {

Shape::Shape(const detail::TypeInfo& type, std::vector<MemberDescriptor> members)
    : type_(&type)
    , members_(std::move(members))
{}

Shape Shape::build(const detail::TypeInfo& type) {
    std::vector<MemberDescriptor> members;
    members.reserve(type.members.size());

    for (const auto& member : type.members) {
        if (!member.readable || !member.writable || !member.assign) {
            PROPSYNC_DEBUG("shape ", type.name, ": skipping ", member.name,
                           " (readable=", member.readable, ", writable=", member.writable, ")");
            continue;
        }

        MemberDescriptor descriptor;
        descriptor.name = member.name;
        descriptor.assign = member.assign;
        if (member.category == detail::MemberCategory::BindableList) {
            descriptor.kind = MemberKind::MergeableOrderedCollection;
            descriptor.merge = member.merge;
        }
        members.push_back(std::move(descriptor));
    }

    PROPSYNC_DEBUG("shape ", type.name, ": ", members.size(), " of ", type.members.size(), " members copyable");
    return Shape{type, std::move(members)};
}

const MemberDescriptor* Shape::find(std::string_view name) const {
    for (const auto& member : members_) {
        if (member.name == name) {
            return &member;
        }
    }
    return nullptr;
}

const MemberDescriptor& Shape::at(std::string_view name) const {
    if (const auto* member = find(name)) {
        return *member;
    }
    throw PropertyNotFoundError(type_name(), name, names());
}

std::vector<std::string_view> Shape::names() const {
    std::vector<std::string_view> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.push_back(member.name);
    }
    return result;
}

} // namespace propsync
