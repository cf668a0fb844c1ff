/**
 * @file MemberSelector.hpp
 * @brief Typed reference to a registered member, used to name exclusions
 */

#ifndef PROPSYNC_MEMBER_SELECTOR_HPP
#define PROPSYNC_MEMBER_SELECTOR_HPP

#include "detail/TypeInfo.hpp"
#include "detail/TypeTraits.hpp"
#include "detail/Log.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace propsync {

/**
 * @brief Selects one member of T by the pointer it was registered with
 *
 * Built implicitly from a data member pointer (&T::field) or a getter
 * pointer (&T::getter). A selector resolves to the registered member whose
 * accessor compares equal; a null selector, or one naming a member that was
 * never registered, resolves to nothing.
 *
 * @code
 * copy_excluding(target, source, {&Customer::id, &Customer::display});
 * @endcode
 */
template<typename T>
class MemberSelector {
public:
    MemberSelector(std::nullptr_t) {}

    template<typename U>
    requires (!std::is_function_v<U>)
    MemberSelector(U T::* member) {
        if (member) {
            matches_ = [member](const std::any& accessor) {
                const auto* registered = std::any_cast<U T::*>(&accessor);
                return registered && *registered == member;
            };
        }
    }

    template<typename Getter>
    requires GetterOf<Getter, T>
    MemberSelector(Getter getter) {
        if (getter) {
            matches_ = [getter](const std::any& accessor) {
                const auto* registered = std::any_cast<Getter>(&accessor);
                return registered && *registered == getter;
            };
        }
    }

    /**
     * @brief Name of the selected member, or nullopt if it does not resolve
     */
    [[nodiscard]] std::optional<std::string> resolve(const detail::TypeInfo& type) const {
        if (!matches_) {
            PROPSYNC_DEBUG("selector on ", type.name, " is null, dropped");
            return std::nullopt;
        }

        for (const auto& member : type.members) {
            if (member.accessor.has_value() && matches_(member.accessor)) {
                return member.name;
            }
        }

        PROPSYNC_DEBUG("selector on ", type.name, " matches no registered member, dropped");
        return std::nullopt;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return static_cast<bool>(matches_);
    }

private:
    std::function<bool(const std::any&)> matches_;
};

/**
 * @brief Braced list of selectors passed to copy_excluding
 *
 * An empty brace list {} default-constructs this type, so a call such as
 * copy_excluding(target, source, {}) picks the name-list overload and
 * copies every member.
 */
template<typename T>
class MemberSelectorList {
public:
    MemberSelectorList() = default;

    MemberSelectorList(std::initializer_list<MemberSelector<T>> selectors)
        : selectors_(selectors) {}

    [[nodiscard]] auto begin() const noexcept { return selectors_.begin(); }
    [[nodiscard]] auto end() const noexcept { return selectors_.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return selectors_.size(); }
    [[nodiscard]] bool empty() const noexcept { return selectors_.empty(); }

private:
    std::vector<MemberSelector<T>> selectors_;
};

} // namespace propsync

#endif // PROPSYNC_MEMBER_SELECTOR_HPP
