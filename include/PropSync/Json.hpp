/**
 * @file Json.hpp
 * @brief JSON text conversion, deep clone and path fragments for registered types
 *
 * Registered class types are written member by member: every readable member
 * becomes a key (named by JsonOptions::naming), and reading fills every
 * writable member whose key is present. Built on nlohmann::json.
 *
 * Usage:
 * @code
 * std::string text = propsync::to_json(customer);
 * std::optional<Customer> back = propsync::from_json<Customer>(text);
 * Customer copy = propsync::json_clone(customer);
 *
 * auto price = propsync::get_json_value<double>(text, "orders[0].price");
 * @endcode
 */

#ifndef PROPSYNC_JSON_HPP
#define PROPSYNC_JSON_HPP

#include "JsonOptions.hpp"
#include "StringUtil.hpp"
#include "detail/Exceptions.hpp"
#include "detail/JsonCodec.hpp"
#include "detail/Log.hpp"
#include "detail/TypeTraits.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace propsync {

namespace detail {

/**
 * @brief Parse JSON text
 * @throws JsonError naming type_name if the text is malformed
 */
nlohmann::json parse_json(std::string_view text, std::string_view type_name);

/**
 * @brief Serialize with the indentation of options; invalid UTF-8 is replaced
 */
std::string dump_json(const nlohmann::json& document, const JsonOptions& options);

/**
 * @brief Value at path inside the JSON text, or nullopt
 *
 * Never throws for bad input: blank text, blank path, malformed JSON and
 * paths that do not resolve all give nullopt.
 */
std::optional<nlohmann::json> select_json(std::string_view json, std::string_view path);

template<typename T>
concept JsonReadable = has_json_codec<T>() && DefaultConstructible<T>;

template<typename T>
concept JsonWritable = has_json_codec<T>();

} // namespace detail

// ==================== Serialization ====================

/**
 * @brief Serialize a value to JSON text
 *
 * Output is indented by options.indent spaces (compact for a negative
 * indent) and keeps non-ASCII characters unescaped.
 *
 * @throws TypeNotRegisteredError if a nested class type was never registered
 */
template<typename T>
requires detail::JsonWritable<T>
std::string to_json(const T& value, const JsonOptions& options = {}) {
    nlohmann::json document;
    detail::value_to_json(value, document, options);
    return detail::dump_json(document, options);
}

/**
 * @brief Serialize the pointee, or "null" for a null pointer
 */
template<typename T>
requires detail::JsonWritable<T> && (!std::is_same_v<std::remove_cv_t<T>, char>)
std::string to_json(const T* value, const JsonOptions& options = {}) {
    if (!value) {
        return "null";
    }
    return to_json(*value, options);
}

// ==================== Deserialization ====================

/**
 * @brief Parse JSON text into a new T
 *
 * @return nullopt for blank text or a JSON null
 * @throws JsonError if the text is malformed or does not fit T
 */
template<typename T>
requires detail::JsonReadable<T>
std::optional<T> from_json(std::string_view text, const JsonOptions& options = {}) {
    if (is_null_or_white_space(text)) {
        return std::nullopt;
    }

    const nlohmann::json document = detail::parse_json(text, detail::type_name<T>());
    if (document.is_null()) {
        return std::nullopt;
    }

    T value{};
    try {
        detail::value_from_json(document, value, options);
    } catch (const nlohmann::json::exception& e) {
        throw JsonError(detail::type_name<T>(), e.what());
    }
    return value;
}

/**
 * @brief from_json that reports failure instead of throwing
 *
 * @return true and assigns out on success; false, leaving out untouched, for
 *         blank, malformed, null or mismatched input
 */
template<typename T>
requires detail::JsonReadable<T>
bool try_from_json(std::string_view text, T& out, const JsonOptions& options = {}) {
    try {
        auto parsed = from_json<T>(text, options);
        if (!parsed) {
            return false;
        }
        out = std::move(*parsed);
        return true;
    } catch (const SyncError& e) {
        PROPSYNC_DEBUG("try_from_json<", detail::type_name<T>(), "> failed: ", e.what());
        return false;
    } catch (const nlohmann::json::exception& e) {
        PROPSYNC_DEBUG("try_from_json<", detail::type_name<T>(), "> failed: ", e.what());
        return false;
    }
}

// ==================== Clone ====================

/**
 * @brief Deep copy through a JSON round trip
 *
 * Shared members (lists, pointees) of the copy are fresh instances. Only
 * members that are both written and read by the codec survive the trip;
 * read-only and write-only members of the copy keep their default values.
 */
template<typename T>
requires detail::JsonReadable<T>
T json_clone(const T& value) {
    static const JsonOptions options{JsonNaming::AsDeclared, -1};

    nlohmann::json document;
    detail::value_to_json(value, document, options);

    T copy{};
    try {
        detail::value_from_json(document, copy, options);
    } catch (const nlohmann::json::exception& e) {
        throw JsonError(detail::type_name<T>(), e.what());
    }
    return copy;
}

/**
 * @brief json_clone into a new shared instance; null in, null out
 */
template<typename T>
requires detail::JsonReadable<T>
std::shared_ptr<T> json_clone(const T* value) {
    if (!value) {
        return nullptr;
    }
    return std::make_shared<T>(json_clone(*value));
}

// ==================== Fragments ====================

/**
 * @brief Compact JSON text of the value at path
 *
 * Paths are '.'-separated property names, each optionally followed by
 * one or more [index] suffixes: "user.name", "items[0].price", "grid[1][2]".
 * Property names match exactly. Empty segments are skipped.
 *
 * @return nullopt for blank input, malformed JSON or a path that does not
 *         resolve
 */
std::optional<std::string> get_json_fragment(std::string_view json, std::string_view path);

/**
 * @brief Whether path resolves inside the JSON text
 */
bool has_json_path(std::string_view json, std::string_view path);

/**
 * @brief Value at path converted to T
 *
 * @return nullopt if the path does not resolve, holds null, or does not
 *         convert to T
 */
template<typename T>
requires detail::JsonReadable<T>
std::optional<T> get_json_value(std::string_view json, std::string_view path,
                                const JsonOptions& options = {}) {
    auto node = detail::select_json(json, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }

    T value{};
    try {
        detail::value_from_json(*node, value, options);
    } catch (const SyncError& e) {
        PROPSYNC_DEBUG("get_json_value at ", path, " failed: ", e.what());
        return std::nullopt;
    } catch (const nlohmann::json::exception& e) {
        PROPSYNC_DEBUG("get_json_value at ", path, " failed: ", e.what());
        return std::nullopt;
    }
    return value;
}

} // namespace propsync

#endif // PROPSYNC_JSON_HPP
