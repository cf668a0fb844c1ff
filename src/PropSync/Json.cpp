/**
 * @file Json.cpp
 * @brief Object codec, text helpers and path navigation
 */

#include "PropSync/Json.hpp"
#include "PropSync/detail/Log.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>

namespace propsync {

namespace detail {

namespace {

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

char to_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Lowers the leading run of capitals, leaving the last capital of a run
// that starts a new word: "Name" -> "name", "ID" -> "id", "URLValue" -> "urlValue".
std::string camel_case(std::string_view name) {
    std::string result{name};
    for (std::size_t i = 0; i < result.size(); ++i) {
        if (i == 1 && !is_upper(result[i])) {
            break;
        }

        const bool has_next = i + 1 < result.size();
        if (i > 0 && has_next && !is_upper(result[i + 1])) {
            if (result[i + 1] == ' ') {
                result[i] = to_lower(result[i]);
            }
            break;
        }

        result[i] = to_lower(result[i]);
    }
    return result;
}

/**
 * @brief Step into one path segment: name, name[i], [i] or name[i][j]...
 */
const nlohmann::json* step(const nlohmann::json* current, std::string_view segment) {
    const auto bracket = segment.find('[');
    const std::string_view name = segment.substr(0, bracket);

    if (!name.empty()) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(std::string{name});
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }

    std::size_t pos = bracket;
    while (pos != std::string_view::npos && pos < segment.size()) {
        if (segment[pos] != '[') {
            return nullptr;
        }
        const auto close = segment.find(']', pos);
        if (close == std::string_view::npos) {
            return nullptr;
        }

        const std::string_view digits = segment.substr(pos + 1, close - pos - 1);
        long long index = -1;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (ec != std::errc{} || end != digits.data() + digits.size()) {
            return nullptr;
        }

        if (!current->is_array() || index < 0 ||
            static_cast<unsigned long long>(index) >= current->size()) {
            return nullptr;
        }
        current = &(*current)[static_cast<std::size_t>(index)];
        pos = close + 1;
    }

    return current;
}

} // namespace

std::string json_key(std::string_view member_name, const JsonOptions& options) {
    switch (options.naming) {
        case JsonNaming::CamelCase:
            return camel_case(member_name);
        case JsonNaming::AsDeclared:
            break;
    }
    return std::string{member_name};
}

void write_object(const TypeInfo& info, const void* obj, nlohmann::json& out, const JsonOptions& options) {
    out = nlohmann::json::object();

    for (const auto& member : info.members) {
        if (!member.readable) {
            continue;
        }
        if (!member.write_json) {
            PROPSYNC_DEBUG("json ", info.name, "::", member.name, " has no codec, skipped");
            continue;
        }

        nlohmann::json value;
        member.write_json(obj, value, options);
        out[json_key(member.name, options)] = std::move(value);
    }
}

void read_object(const TypeInfo& info, void* obj, const nlohmann::json& in, const JsonOptions& options) {
    if (!in.is_object()) {
        throw JsonError(info.name, std::string{"expected a JSON object, got "} + in.type_name());
    }

    for (const auto& member : info.members) {
        if (!member.writable || !member.read_json) {
            continue;
        }

        auto it = in.find(json_key(member.name, options));
        if (it == in.end()) {
            continue;
        }
        member.read_json(obj, *it, options);
    }
}

nlohmann::json parse_json(std::string_view text, std::string_view type_name) {
    try {
        return nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw JsonError(type_name, e.what());
    }
}

std::string dump_json(const nlohmann::json& document, const JsonOptions& options) {
    const int indent = options.indent < 0 ? -1 : options.indent;
    return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<nlohmann::json> select_json(std::string_view json, std::string_view path) {
    if (is_null_or_white_space(json) || is_null_or_white_space(path)) {
        return std::nullopt;
    }

    const nlohmann::json document = nlohmann::json::parse(json.begin(), json.end(), nullptr, false);
    if (document.is_discarded()) {
        PROPSYNC_DEBUG("select_json: malformed JSON");
        return std::nullopt;
    }

    const nlohmann::json* current = &document;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            dot = path.size();
        }

        const std::string_view segment = path.substr(start, dot - start);
        if (!is_null_or_white_space(segment)) {
            current = step(current, segment);
            if (!current) {
                return std::nullopt;
            }
        }
        start = dot + 1;
    }

    return *current;
}

} // namespace detail

std::optional<std::string> get_json_fragment(std::string_view json, std::string_view path) {
    auto node = detail::select_json(json, path);
    if (!node) {
        return std::nullopt;
    }
    return node->dump();
}

bool has_json_path(std::string_view json, std::string_view path) {
    return detail::select_json(json, path).has_value();
}

} // namespace propsync
