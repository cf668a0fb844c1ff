#include "PropSync/StringUtil.hpp"

#include <algorithm>
#include <cctype>

namespace propsync {

bool is_null_or_empty(const char* value) noexcept {
    return value == nullptr || *value == '\0';
}

bool is_null_or_empty(std::string_view value) noexcept {
    return value.empty();
}

bool is_null_or_empty(const std::string& value) noexcept {
    return value.empty();
}

bool is_null_or_empty(const std::optional<std::string>& value) noexcept {
    return !value || value->empty();
}

bool is_null_or_white_space(std::string_view value) noexcept {
    return std::all_of(value.begin(), value.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

bool is_null_or_white_space(const char* value) noexcept {
    return value == nullptr || is_null_or_white_space(std::string_view{value});
}

bool is_null_or_white_space(const std::string& value) noexcept {
    return is_null_or_white_space(std::string_view{value});
}

bool is_null_or_white_space(const std::optional<std::string>& value) noexcept {
    return !value || is_null_or_white_space(std::string_view{*value});
}

} // namespace propsync
