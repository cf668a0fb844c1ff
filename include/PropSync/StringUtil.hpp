/**
 * @file StringUtil.hpp
 * @brief Null, empty and blank checks for the string forms used by callers
 *
 * A null const char* and a disengaged std::optional<std::string> both count
 * as null. Whitespace is the C locale isspace set (space, \t, \n, \v, \f, \r).
 */

#ifndef PROPSYNC_STRING_UTIL_HPP
#define PROPSYNC_STRING_UTIL_HPP

#include <optional>
#include <string>
#include <string_view>

namespace propsync {

[[nodiscard]] bool is_null_or_empty(const char* value) noexcept;
[[nodiscard]] bool is_null_or_empty(std::string_view value) noexcept;
[[nodiscard]] bool is_null_or_empty(const std::string& value) noexcept;
[[nodiscard]] bool is_null_or_empty(const std::optional<std::string>& value) noexcept;

[[nodiscard]] bool is_null_or_white_space(const char* value) noexcept;
[[nodiscard]] bool is_null_or_white_space(std::string_view value) noexcept;
[[nodiscard]] bool is_null_or_white_space(const std::string& value) noexcept;
[[nodiscard]] bool is_null_or_white_space(const std::optional<std::string>& value) noexcept;

} // namespace propsync

#endif // PROPSYNC_STRING_UTIL_HPP
