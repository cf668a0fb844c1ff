/**
 * @file EnumDescription.hpp
 * @brief Registered names and human-readable descriptions for enumerators
 *
 * Usage:
 * @code
 * PROPSYNC_REGISTRATION
 * {
 *     EnumRegistry<OrderState>()
 *         .value("Pending", OrderState::Pending, "Waiting for payment")
 *         .value("Shipped", OrderState::Shipped, "On its way");
 * }
 *
 * enum_description(OrderState::Pending);   // "Waiting for payment"
 * enum_name(OrderState::Shipped);          // "Shipped"
 * @endcode
 */

#ifndef PROPSYNC_ENUM_DESCRIPTION_HPP
#define PROPSYNC_ENUM_DESCRIPTION_HPP

#include "detail/TypeInfo.hpp"
#include "detail/TypeManager.hpp"
#include "detail/TypeTraits.hpp"
#include "detail/Log.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace propsync {

/**
 * @brief Fluent registration of the enumerators of E
 *
 * Registering the same value twice replaces its name and description.
 */
template<Enumeration E>
class EnumRegistry {
public:
    EnumRegistry() {
        const std::string type_name{detail::type_name<E>()};

        auto& mgr = detail::TypeManager::instance();
        if (!mgr.is_registered(type_name)) {
            detail::TypeInfo info{type_name, sizeof(E), std::type_index(typeid(E))};
            info.is_enum = true;
            mgr.register_type(type_name, std::move(info), detail::type_id<E>);
            PROPSYNC_DEBUG("registered enum: ", type_name);
        }
        info_ = mgr.get_type_mutable(type_name);
    }

    EnumRegistry& value(std::string_view name, E value, std::string_view description = {}) {
        if (!info_) return *this;

        const auto underlying = static_cast<std::int64_t>(static_cast<std::underlying_type_t<E>>(value));
        for (auto& entry : info_->enumerators) {
            if (entry.value == underlying) {
                entry.name = std::string{name};
                entry.description = std::string{description};
                return *this;
            }
        }

        info_->enumerators.push_back(detail::EnumEntry{underlying, std::string{name}, std::string{description}});
        return *this;
    }

private:
    detail::TypeInfo* info_ = nullptr;
};

namespace detail {

template<Enumeration E>
const EnumEntry* find_enum_entry(E value) {
    const TypeInfo* info = TypeManager::instance().get_type_by_id(type_id<E>);
    if (!info) {
        return nullptr;
    }
    return info->find_enumerator(static_cast<std::int64_t>(static_cast<std::underlying_type_t<E>>(value)));
}

template<Enumeration E>
std::string numeric_name(E value) {
    return std::to_string(static_cast<std::underlying_type_t<E>>(value));
}

} // namespace detail

/**
 * @brief Registered name of value, or its decimal value if unregistered
 */
template<Enumeration E>
std::string enum_name(E value) {
    if (const auto* entry = detail::find_enum_entry(value); entry && !entry->name.empty()) {
        return entry->name;
    }
    return detail::numeric_name(value);
}

/**
 * @brief Registered description of value
 *
 * Falls back to enum_name when no non-empty description was registered.
 */
template<Enumeration E>
std::string enum_description(E value) {
    if (const auto* entry = detail::find_enum_entry(value); entry && !entry->description.empty()) {
        return entry->description;
    }
    return enum_name(value);
}

/**
 * @brief Enumerator registered under name
 */
template<Enumeration E>
std::optional<E> enum_value(std::string_view name) {
    const detail::TypeInfo* info = detail::TypeManager::instance().get_type_by_id(detail::type_id<E>);
    if (!info) {
        return std::nullopt;
    }

    for (const auto& entry : info->enumerators) {
        if (entry.name == name) {
            return static_cast<E>(static_cast<std::underlying_type_t<E>>(entry.value));
        }
    }
    return std::nullopt;
}

} // namespace propsync

#endif // PROPSYNC_ENUM_DESCRIPTION_HPP
