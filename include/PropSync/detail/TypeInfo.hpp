/**
 * @file TypeInfo.hpp
 * @brief Type information data structures for the PropSync library
 *
 * This file defines the metadata recorded by registration:
 * - MemberInfo: a named member with its accessors and type-erased operations
 * - EnumEntry: one registered enumerator with its description
 * - TypeInfo: complete type metadata with members in registration order
 */

#ifndef PROPSYNC_DETAIL_TYPE_INFO_HPP
#define PROPSYNC_DETAIL_TYPE_INFO_HPP

#include "../JsonOptions.hpp"

#include <nlohmann/json_fwd.hpp>

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace propsync::detail {

// FNV-1a hash for string_view
constexpr std::size_t type_info_hash(std::string_view str) noexcept {
    std::size_t hash = 14695981039346656037ULL;
    for (char c : str) {
        hash ^= static_cast<std::size_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

// Transparent hash for string_view lookups
struct TransparentStringHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view sv) const noexcept {
        return type_info_hash(sv);
    }
    std::size_t operator()(const std::string& s) const noexcept {
        return type_info_hash(std::string_view{s});
    }
    std::size_t operator()(const char* s) const noexcept {
        return type_info_hash(std::string_view{s});
    }
};

struct TransparentStringEqual {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return lhs == rhs;
    }
    bool operator()(const char* lhs, std::string_view rhs) const noexcept {
        return std::string_view{lhs} == rhs;
    }
    bool operator()(std::string_view lhs, const char* rhs) const noexcept {
        return lhs == std::string_view{rhs};
    }
};

template<typename V>
using TransparentStringMap = std::unordered_map<std::string, V, TransparentStringHash, TransparentStringEqual>;

/**
 * @brief Category of a member property
 */
enum class MemberCategory {
    Primitive,      ///< Arithmetic types (int, float, etc.)
    Class,          ///< User-defined class types and strings
    Enum,           ///< Enumeration types
    Sequential,     ///< Sequential containers held by value
    Pointer,        ///< Smart or raw pointers (reference semantics)
    BindableList    ///< shared_ptr to an ObservableList or BindingList
};

/**
 * @brief Information about a registered member
 *
 * A member is a data member or an accessor member built from a getter
 * and/or setter. Operations that cannot exist for the member's access mode
 * are left empty: a read-only member has no assign and no read_json, a
 * write-only member has no assign and no write_json. merge is set exactly
 * when the member is writable and its category is BindableList.
 */
struct MemberInfo {
    using Copier = std::function<void(void* target, const void* source)>;
    using JsonWriter = std::function<void(const void* obj, nlohmann::json& out, const JsonOptions& options)>;
    using JsonReader = std::function<void(void* obj, const nlohmann::json& in, const JsonOptions& options)>;

    std::string name;                   ///< Name of the member
    std::type_index type_index{typeid(void)};  ///< Declared member type
    std::string type_name;              ///< Human-readable type name
    MemberCategory category = MemberCategory::Primitive;
    bool readable = false;
    bool writable = false;

    Copier assign;                      ///< target.member = source.member
    Copier merge;                       ///< In-place collection merge, bindable lists only
    JsonWriter write_json;
    JsonReader read_json;

    /// The member pointer or getter pointer the member was registered with,
    /// compared against selectors when resolving exclusions.
    std::any accessor;
};

/**
 * @brief One registered enumerator
 */
struct EnumEntry {
    std::int64_t value = 0;
    std::string name;
    std::string description;
};

/**
 * @brief Complete type information structure
 *
 * Members are kept in registration order; member_index maps a name to its
 * position in that sequence.
 */
struct TypeInfo {
    std::string name;                   ///< Type name
    std::size_t size = 0;               ///< Size of the type in bytes
    std::type_index type_index{typeid(void)};
    bool is_enum = false;

    std::vector<MemberInfo> members;
    TransparentStringMap<std::size_t> member_index;

    std::vector<EnumEntry> enumerators;

    TypeInfo() = default;

    TypeInfo(std::string_view n, std::size_t s, std::type_index ti)
        : name{n}
        , size{s}
        , type_index{ti}
    {}

    /**
     * @brief Add a member, or replace the one with the same name in place
     */
    void add_member(MemberInfo member) {
        auto it = member_index.find(std::string_view{member.name});
        if (it != member_index.end()) {
            members[it->second] = std::move(member);
            return;
        }
        member_index.emplace(member.name, members.size());
        members.push_back(std::move(member));
    }

    [[nodiscard]] bool has_member(std::string_view member_name) const {
        return member_index.find(member_name) != member_index.end();
    }

    [[nodiscard]] const MemberInfo* find_member(std::string_view member_name) const {
        auto it = member_index.find(member_name);
        return it != member_index.end() ? &members[it->second] : nullptr;
    }

    /**
     * @brief Member names in registration order
     */
    [[nodiscard]] std::vector<std::string_view> member_names() const {
        std::vector<std::string_view> names;
        names.reserve(members.size());
        for (const auto& member : members) {
            names.push_back(member.name);
        }
        return names;
    }

    [[nodiscard]] const EnumEntry* find_enumerator(std::int64_t value) const {
        for (const auto& entry : enumerators) {
            if (entry.value == value) {
                return &entry;
            }
        }
        return nullptr;
    }
};

} // namespace propsync::detail

#endif // PROPSYNC_DETAIL_TYPE_INFO_HPP
