/**
 * @file Registry.hpp
 * @brief Type registration API for the PropSync library
 *
 * This file implements the Registry<T> class which provides a fluent interface
 * for registering the members of a type:
 * - Data members (readable and writable unless const or not copy-assignable)
 * - Read-only accessors (getter)
 * - Read-write accessor pairs (getter and setter)
 * - Write-only accessors (setter)
 */

#ifndef PROPSYNC_DETAIL_REGISTRY_HPP
#define PROPSYNC_DETAIL_REGISTRY_HPP

#include "TypeInfo.hpp"
#include "TypeManager.hpp"
#include "TypeTraits.hpp"
#include "JsonCodec.hpp"
#include "Merge.hpp"
#include "Log.hpp"

#include <any>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace propsync {

/**
 * @brief Type registration class with fluent interface
 *
 * Registry<T> provides a chainable API for registering type metadata.
 * Upon construction, it creates the TypeInfo for T unless T is already
 * registered, in which case further calls extend the existing entry.
 * Members keep the order in which they are registered.
 *
 * @tparam T The type to register (must satisfy Reflectable concept)
 *
 * Usage:
 * @code
 * Registry<Customer>()
 *     .property("Name", &Customer::name)
 *     .property("Id", &Customer::id)
 *     .property("Display", &Customer::display)                       // read-only
 *     .property("Email", &Customer::email, &Customer::set_email)     // read-write
 *     .write_only("Password", &Customer::set_password);
 * @endcode
 */
template<Reflectable T>
class Registry {
public:
    Registry() {
        type_name_ = std::string{detail::type_name<T>()};

        auto& mgr = detail::TypeManager::instance();
        if (mgr.is_registered(type_name_)) {
            PROPSYNC_DEBUG("type already registered: ", type_name_);
            info_ = mgr.get_type_mutable(type_name_);
            return;
        }

        detail::TypeInfo new_info{
            type_name_,
            sizeof(T),
            std::type_index(typeid(T))
        };

        mgr.register_type(type_name_, std::move(new_info), detail::type_id<T>);
        info_ = mgr.get_type_mutable(type_name_);
        PROPSYNC_DEBUG("registered type: ", type_name_, " size: ", sizeof(T));
    }

    /**
     * @brief Register a data member
     *
     * The member is writable when its type is copy-assignable; a const
     * member is therefore read-only.
     *
     * @tparam U The member type
     * @param name The property name
     * @param member Pointer to member
     * @return Reference to this Registry for chaining
     */
    template<typename U>
    requires (!std::is_function_v<U>)
    Registry& property(std::string_view name, U T::* member) {
        if (!info_) return *this;

        constexpr bool writable = CopyAssignable<U>;

        detail::MemberInfo info = make_member<std::remove_cv_t<U>>(name, true, writable);
        info.accessor = member;

        if constexpr (writable) {
            info.assign = [member](void* target, const void* source) {
                static_cast<T*>(target)->*member = static_cast<const T*>(source)->*member;
            };
            if constexpr (detail::is_mergeable_collection_v<U>) {
                info.merge = [member](void* target, const void* source) {
                    detail::merge_collection(static_cast<T*>(target)->*member,
                                             static_cast<const T*>(source)->*member);
                };
            }
        }

        if constexpr (detail::has_json_codec<std::remove_cv_t<U>>()) {
            info.write_json = [member](const void* obj, nlohmann::json& out, const JsonOptions& options) {
                detail::value_to_json(static_cast<const T*>(obj)->*member, out, options);
            };
            if constexpr (writable) {
                info.read_json = [member](void* obj, const nlohmann::json& in, const JsonOptions& options) {
                    detail::value_from_json(in, static_cast<T*>(obj)->*member, options);
                };
            }
        }

        add(std::move(info));
        return *this;
    }

    /**
     * @brief Register a read-only accessor
     *
     * Read-only members are visible to JSON serialization but never copied.
     */
    template<typename Getter>
    requires GetterOf<Getter, T>
    Registry& property(std::string_view name, Getter getter) {
        if (!info_) return *this;

        using V = detail::getter_value_t<Getter, T>;

        detail::MemberInfo info = make_member<V>(name, true, false);
        info.accessor = getter;

        if constexpr (detail::has_json_codec<V>()) {
            info.write_json = [getter](const void* obj, nlohmann::json& out, const JsonOptions& options) {
                const V value = (static_cast<const T*>(obj)->*getter)();
                detail::value_to_json(value, out, options);
            };
        }

        add(std::move(info));
        return *this;
    }

    /**
     * @brief Register a read-write accessor pair
     *
     * Copying calls setter(target, getter(source)). The merge operation for
     * bindable lists reads both current lists through the getter and never
     * calls the setter.
     */
    template<typename Getter, typename Setter>
    requires GetterOf<Getter, T> && std::is_member_function_pointer_v<Setter>
    Registry& property(std::string_view name, Getter getter, Setter setter) {
        if (!info_) return *this;

        using V = detail::getter_value_t<Getter, T>;

        detail::MemberInfo info = make_member<V>(name, true, true);
        info.accessor = getter;

        info.assign = [getter, setter](void* target, const void* source) {
            (static_cast<T*>(target)->*setter)((static_cast<const T*>(source)->*getter)());
        };

        if constexpr (detail::is_mergeable_collection_v<V>) {
            info.merge = [getter](void* target, const void* source) {
                const V target_list = (static_cast<const T*>(target)->*getter)();
                const V source_list = (static_cast<const T*>(source)->*getter)();
                detail::merge_collection(target_list, source_list);
            };
        }

        if constexpr (detail::has_json_codec<V>()) {
            info.write_json = [getter](const void* obj, nlohmann::json& out, const JsonOptions& options) {
                const V value = (static_cast<const T*>(obj)->*getter)();
                detail::value_to_json(value, out, options);
            };
            info.read_json = [getter, setter](void* obj, const nlohmann::json& in, const JsonOptions& options) {
                V value = (static_cast<const T*>(obj)->*getter)();
                detail::value_from_json(in, value, options);
                (static_cast<T*>(obj)->*setter)(std::move(value));
            };
        }

        add(std::move(info));
        return *this;
    }

    /**
     * @brief Register a write-only accessor
     *
     * Write-only members can be filled from JSON but are never copied.
     */
    template<typename Setter>
    requires std::is_member_function_pointer_v<Setter>
    Registry& write_only(std::string_view name, Setter setter) {
        if (!info_) return *this;

        using V = typename detail::setter_traits<Setter>::value_type;

        detail::MemberInfo info = make_member<V>(name, false, true);
        info.accessor = setter;

        if constexpr (detail::has_json_codec<V>() && std::is_default_constructible_v<V>) {
            info.read_json = [setter](void* obj, const nlohmann::json& in, const JsonOptions& options) {
                V value{};
                detail::value_from_json(in, value, options);
                (static_cast<T*>(obj)->*setter)(std::move(value));
            };
        }

        add(std::move(info));
        return *this;
    }

private:
    std::string type_name_;
    detail::TypeInfo* info_ = nullptr;

    void add(detail::MemberInfo member) {
        PROPSYNC_DEBUG("member ", type_name_, "::", member.name,
                       " readable=", member.readable, " writable=", member.writable,
                       " mergeable=", static_cast<bool>(member.merge));
        info_->add_member(std::move(member));
    }

    template<typename U>
    static detail::MemberInfo make_member(std::string_view name, bool readable, bool writable) {
        detail::MemberInfo info;
        info.name = std::string{name};
        info.type_index = std::type_index(typeid(U));
        info.type_name = std::string{detail::type_name<U>()};
        info.category = detect_category<U>();
        info.readable = readable;
        info.writable = writable;
        return info;
    }

    /**
     * @brief Detect the category of a member type
     */
    template<typename U>
    static constexpr detail::MemberCategory detect_category() {
        if constexpr (detail::is_mergeable_collection_v<U>) {
            return detail::MemberCategory::BindableList;
        } else if constexpr (std::is_enum_v<U>) {
            return detail::MemberCategory::Enum;
        } else if constexpr (std::is_pointer_v<U> || detail::is_shared_ptr_v<U>) {
            return detail::MemberCategory::Pointer;
        } else if constexpr (std::is_arithmetic_v<U>) {
            return detail::MemberCategory::Primitive;
        } else if constexpr (detail::is_string_v<U>) {
            return detail::MemberCategory::Class;
        } else if constexpr (detail::is_sequential_container_v<U>) {
            return detail::MemberCategory::Sequential;
        } else if constexpr (std::is_class_v<U>) {
            return detail::MemberCategory::Class;
        } else {
            return detail::MemberCategory::Primitive;
        }
    }
};

} // namespace propsync

#endif // PROPSYNC_DETAIL_REGISTRY_HPP
