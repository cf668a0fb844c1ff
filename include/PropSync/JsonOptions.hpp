/**
 * @file JsonOptions.hpp
 * @brief Run-time options shared by every JSON entry point
 */

#ifndef PROPSYNC_JSON_OPTIONS_HPP
#define PROPSYNC_JSON_OPTIONS_HPP

namespace propsync {

/**
 * @brief How registered member names are mapped to JSON keys
 */
enum class JsonNaming {
    AsDeclared,     ///< Keys are the registered member names
    CamelCase       ///< First character lowered ("UserName" -> "userName")
};

/**
 * @brief Serializer settings
 *
 * The defaults write camelCase keys with two-space indentation.
 * An indent below zero produces compact output.
 */
struct JsonOptions {
    JsonNaming naming = JsonNaming::CamelCase;
    int indent = 2;
};

} // namespace propsync

#endif // PROPSYNC_JSON_OPTIONS_HPP
