/**
 * @file JsonCodec.hpp
 * @brief Per-value JSON conversion used by registered members
 *
 * Conversion rules, checked in this order:
 * - nlohmann::json itself: stored as is
 * - std::shared_ptr<X>: null <-> JSON null, otherwise the pointee
 * - ObservableList / BindingList: JSON array of elements
 * - types nlohmann::json converts itself (arithmetic, strings, enums, ...)
 * - other sequential containers: JSON array of elements
 * - registered class types: JSON object, member by member
 */

#ifndef PROPSYNC_DETAIL_JSON_CODEC_HPP
#define PROPSYNC_DETAIL_JSON_CODEC_HPP

#include "TypeInfo.hpp"
#include "TypeManager.hpp"
#include "TypeTraits.hpp"
#include "Exceptions.hpp"
#include "../JsonOptions.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace propsync {

/**
 * @brief Types that nlohmann::json converts in both directions on its own
 */
template<typename U>
concept JsonConvertible = requires(nlohmann::json& j, const nlohmann::json& cj, const U& cu, U& u) {
    nlohmann::to_json(j, cu);
    nlohmann::from_json(cj, u);
};

namespace detail {

/**
 * @brief JSON key for a member name under the given naming policy
 */
std::string json_key(std::string_view member_name, const JsonOptions& options);

/**
 * @brief Write every readable member of a registered object
 */
void write_object(const TypeInfo& info, const void* obj, nlohmann::json& out, const JsonOptions& options);

/**
 * @brief Read every writable member present in a JSON object
 *
 * Members whose key is missing keep their current value.
 *
 * @throws JsonError if in is not a JSON object
 */
void read_object(const TypeInfo& info, void* obj, const nlohmann::json& in, const JsonOptions& options);

template<typename U>
consteval bool has_json_codec() {
    if constexpr (std::is_same_v<U, nlohmann::json>) {
        return true;
    } else if constexpr (is_shared_ptr_v<U>) {
        return has_json_codec<typename U::element_type>();
    } else if constexpr (is_bindable_list_v<U>) {
        return has_json_codec<typename U::value_type>();
    } else if constexpr (JsonConvertible<U>) {
        return true;
    } else if constexpr (SequentialContainer<U>) {
        return has_json_codec<typename U::value_type>();
    } else {
        return Reflectable<U>;
    }
}

template<typename U>
void value_to_json(const U& value, nlohmann::json& out, const JsonOptions& options) {
    if constexpr (std::is_same_v<U, nlohmann::json>) {
        out = value;
    } else if constexpr (is_shared_ptr_v<U>) {
        if (!value) {
            out = nullptr;
            return;
        }
        value_to_json(*value, out, options);
    } else if constexpr (is_bindable_list_v<U> || (!JsonConvertible<U> && SequentialContainer<U>)) {
        out = nlohmann::json::array();
        for (const auto& item : value) {
            nlohmann::json element;
            value_to_json(item, element, options);
            out.push_back(std::move(element));
        }
    } else if constexpr (JsonConvertible<U>) {
        nlohmann::to_json(out, value);
    } else {
        write_object(type_info_of<U>(), &value, out, options);
    }
}

template<typename U>
void value_from_json(const nlohmann::json& in, U& value, const JsonOptions& options) {
    if constexpr (std::is_same_v<U, nlohmann::json>) {
        value = in;
    } else if constexpr (is_shared_ptr_v<U>) {
        using Element = typename U::element_type;
        if (in.is_null()) {
            value.reset();
            return;
        }
        auto fresh = std::make_shared<Element>();
        value_from_json(in, *fresh, options);
        value = std::move(fresh);
    } else if constexpr (is_bindable_list_v<U> || (!JsonConvertible<U> && SequentialContainer<U>)) {
        if (!in.is_array()) {
            throw JsonError(type_name<U>(), "expected a JSON array");
        }
        U fresh;
        for (const auto& element : in) {
            typename U::value_type item{};
            value_from_json(element, item, options);
            fresh.push_back(std::move(item));
        }
        value = std::move(fresh);
    } else if constexpr (JsonConvertible<U>) {
        nlohmann::from_json(in, value);
    } else {
        read_object(type_info_of<U>(), &value, in, options);
    }
}

} // namespace detail

} // namespace propsync

#endif // PROPSYNC_DETAIL_JSON_CODEC_HPP
