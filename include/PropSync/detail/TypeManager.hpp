/**
 * @file TypeManager.hpp
 * @brief Process-wide table of registered types
 *
 * Registry<T> and EnumRegistry<E> write here; shapes, plans and the JSON
 * codec read from here. A type is found by name, by std::type_index or by
 * its compile-time TypeId.
 */

#ifndef PROPSYNC_DETAIL_TYPE_MANAGER_HPP
#define PROPSYNC_DETAIL_TYPE_MANAGER_HPP

#include "TypeInfo.hpp"
#include "TypeTraits.hpp"
#include "Exceptions.hpp"

#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>

namespace propsync::detail {

/**
 * @brief Owner of every registered TypeInfo
 *
 * Lookups share a read lock; registration takes the write lock. TypeInfo
 * objects are node-stable, so the pointers that shapes and plans keep stay
 * valid for the process lifetime.
 */
class TypeManager {
public:
    /**
     * @brief Get the singleton instance
     * @return Reference to the global TypeManager instance
     */
    static TypeManager& instance() {
        static TypeManager mgr;
        return mgr;
    }

    TypeManager(const TypeManager&) = delete;
    TypeManager& operator=(const TypeManager&) = delete;
    TypeManager(TypeManager&&) = delete;
    TypeManager& operator=(TypeManager&&) = delete;

    /**
     * @brief Register a type with its information
     *
     * Registering a name twice keeps the first entry.
     *
     * @param name The type name
     * @param info The type information to register
     * @param type_id The compile-time type ID
     * @return true if newly registered, false if already existed
     */
    bool register_type(std::string_view name, TypeInfo info, TypeId type_id) {
        std::unique_lock lock(mutex_);

        if (types_by_name_.find(name) != types_by_name_.end()) {
            return false;
        }

        auto [inserted_it, success] = types_by_name_.emplace(std::string{name}, std::move(info));
        if (success) {
            types_by_index_[inserted_it->second.type_index] = &inserted_it->second;
            types_by_id_[type_id] = &inserted_it->second;
        }
        return success;
    }

    /**
     * @brief Get type information by compile-time TypeId (fastest)
     */
    const TypeInfo* get_type_by_id(TypeId id) const {
        std::shared_lock lock(mutex_);
        auto it = types_by_id_.find(id);
        return it != types_by_id_.end() ? it->second : nullptr;
    }

    /**
     * @brief Get type information by compile-time TypeId, throwing if absent
     *
     * @param id The compile-time type ID
     * @param type_name_hint Type name used in the error message
     * @throws TypeNotRegisteredError if the type is not registered
     */
    const TypeInfo& get_type_or_throw(TypeId id, std::string_view type_name_hint) const {
        const TypeInfo* info = get_type_by_id(id);
        if (!info) [[unlikely]] {
            throw TypeNotRegisteredError(type_name_hint);
        }
        return *info;
    }

    const TypeInfo* get_type(std::string_view name) const {
        std::shared_lock lock(mutex_);
        auto it = types_by_name_.find(name);
        return it != types_by_name_.end() ? &it->second : nullptr;
    }

    const TypeInfo* get_type(std::type_index index) const {
        std::shared_lock lock(mutex_);
        auto it = types_by_index_.find(index);
        return it != types_by_index_.end() ? it->second : nullptr;
    }

    /**
     * @brief Get mutable type information by name
     *
     * Used during registration to add members to existing types.
     */
    TypeInfo* get_type_mutable(std::string_view name) {
        std::shared_lock lock(mutex_);
        auto it = types_by_name_.find(name);
        return it != types_by_name_.end() ? &it->second : nullptr;
    }

    bool is_registered(std::string_view name) const {
        std::shared_lock lock(mutex_);
        return types_by_name_.find(name) != types_by_name_.end();
    }

    bool is_registered(TypeId id) const {
        std::shared_lock lock(mutex_);
        return types_by_id_.find(id) != types_by_id_.end();
    }

private:
    TypeManager() = default;
    ~TypeManager() = default;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TypeInfo, TransparentStringHash, TransparentStringEqual> types_by_name_;
    std::unordered_map<std::type_index, const TypeInfo*> types_by_index_;
    std::unordered_map<TypeId, const TypeInfo*> types_by_id_;
};

/**
 * @brief Look up the registered TypeInfo for T, throwing if absent
 */
template<typename T>
const TypeInfo& type_info_of() {
    return TypeManager::instance().get_type_or_throw(type_id<T>, type_name<T>());
}

} // namespace propsync::detail

#endif // PROPSYNC_DETAIL_TYPE_MANAGER_HPP
