/**
 * @file Exceptions.hpp
 * @brief Exception hierarchy for the PropSync library
 *
 * This file defines all exception types used by PropSync:
 * - SyncError: Base exception class
 * - InvalidArgumentError: Thrown when a target or source is null
 * - TypeNotRegisteredError: Thrown when a type is not registered
 * - PropertyNotFoundError: Thrown when a named member is not found
 * - JsonError: Thrown when JSON text cannot be parsed or converted
 */

#ifndef PROPSYNC_DETAIL_EXCEPTIONS_HPP
#define PROPSYNC_DETAIL_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace propsync {

/**
 * @brief Base exception class for all PropSync errors
 *
 * All PropSync-specific exceptions derive from this class,
 * allowing users to catch every library error with a single catch block.
 */
class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    explicit SyncError(const std::string& message)
        : std::runtime_error(message) {}

    explicit SyncError(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a required argument is null
 *
 * Raised by every copy entry point before any member is touched.
 *
 * @code
 * try {
 *     propsync::copy_all(target_ptr, nullptr);
 * } catch (const InvalidArgumentError& e) {
 *     std::cout << "Null argument: " << e.parameter_name() << std::endl;
 * }
 * @endcode
 */
class InvalidArgumentError : public SyncError {
public:
    explicit InvalidArgumentError(std::string_view parameter_name)
        : SyncError(format_message(parameter_name))
        , parameter_name_(parameter_name) {}

    [[nodiscard]] std::string_view parameter_name() const noexcept {
        return parameter_name_;
    }

private:
    static std::string format_message(std::string_view parameter_name) {
        return std::string{"Argument '"} + std::string{parameter_name} + "' must not be null";
    }

    std::string parameter_name_;
};

/**
 * @brief Exception thrown when a type is not registered
 *
 * @code
 * try {
 *     propsync::copy_all_fast(a, b);   // decltype(a) never registered
 * } catch (const TypeNotRegisteredError& e) {
 *     std::cout << "Type not found: " << e.type_name() << std::endl;
 * }
 * @endcode
 */
class TypeNotRegisteredError : public SyncError {
public:
    explicit TypeNotRegisteredError(std::string_view type_name)
        : SyncError(format_message(type_name))
        , type_name_(type_name) {}

    /**
     * @brief Get the name of the unregistered type
     * @return The type name that was not found
     */
    [[nodiscard]] std::string_view type_name() const noexcept {
        return type_name_;
    }

private:
    static std::string format_message(std::string_view type_name) {
        return std::string{"Type '"} + std::string{type_name} + "' is not registered";
    }

    std::string type_name_;
};

/**
 * @brief Exception thrown when a property is not found
 *
 * This exception includes the list of available properties
 * to help users identify the correct property name.
 */
class PropertyNotFoundError : public SyncError {
public:
    PropertyNotFoundError(std::string_view type_name,
                          std::string_view prop_name,
                          const std::vector<std::string_view>& available)
        : SyncError(format_message(type_name, prop_name, available))
        , type_name_(type_name)
        , property_name_(prop_name)
        , available_properties_(available.begin(), available.end()) {}

    [[nodiscard]] std::string_view type_name() const noexcept {
        return type_name_;
    }

    [[nodiscard]] std::string_view property_name() const noexcept {
        return property_name_;
    }

    /**
     * @brief Get the list of available property names
     * @return Vector of available property names
     */
    [[nodiscard]] const std::vector<std::string>& available_properties() const noexcept {
        return available_properties_;
    }

private:
    static std::string format_message(std::string_view type,
                                      std::string_view prop,
                                      const std::vector<std::string_view>& available) {
        std::string msg = "Property '" + std::string{prop} + "' not found in type '" +
                          std::string{type} + "'. Available properties: [";
        bool first = true;
        for (const auto& name : available) {
            if (!first) msg += ", ";
            msg += std::string{name};
            first = false;
        }
        msg += "]";
        return msg;
    }

    std::string type_name_;
    std::string property_name_;
    std::vector<std::string> available_properties_;
};

/**
 * @brief Exception thrown when JSON text cannot be parsed or converted
 *
 * Wraps the message of the underlying nlohmann::json exception together
 * with the name of the type that was being read.
 */
class JsonError : public SyncError {
public:
    JsonError(std::string_view type_name, std::string_view detail)
        : SyncError(format_message(type_name, detail))
        , type_name_(type_name)
        , detail_(detail) {}

    [[nodiscard]] std::string_view type_name() const noexcept {
        return type_name_;
    }

    [[nodiscard]] std::string_view detail() const noexcept {
        return detail_;
    }

private:
    static std::string format_message(std::string_view type_name, std::string_view detail) {
        return std::string{"JSON conversion to '"} + std::string{type_name} +
               "' failed: " + std::string{detail};
    }

    std::string type_name_;
    std::string detail_;
};

} // namespace propsync

#endif // PROPSYNC_DETAIL_EXCEPTIONS_HPP
