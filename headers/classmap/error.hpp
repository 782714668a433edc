//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_ERROR_HPP
#define CLASSMAP_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types for scanning, mapping and loader registration.
 *
 * Error categories:
 * - NotFound: root directory or file does not exist
 * - PermissionDenied: root directory or file cannot be read
 * - InvalidArgument: bad argument (e.g. root is not a directory)
 * - ParseError: a file could not be tokenized
 * - IoError: a read or write failed
 * - ConfigError: option validation or config file parsing failed
 * - EmptyResult: a scan completed but found no symbols
 * - RegistrationError: the host loader rejected a resolver
 * - UnsupportedHost: the host loader is older than required
 * - InternalError: unexpected internal error
 *
 * Usage:
 * @code
 *     auto map = builder.build(dir, options);
 *     if (map.is_err()) {
 *         std::cerr << map.error() << std::endl;
 *         // Output: [NotFound] Directory does not exist (context: /srv/app/src)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace classmap {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,
        NotFound,
        PermissionDenied,
        InvalidArgument,
        ParseError,
        IoError,
        ConfigError,
        EmptyResult,
        RegistrationError,
        UnsupportedHost,
        InternalError
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:              return "None";
            case ErrorCode::NotFound:          return "NotFound";
            case ErrorCode::PermissionDenied:  return "PermissionDenied";
            case ErrorCode::InvalidArgument:   return "InvalidArgument";
            case ErrorCode::ParseError:        return "ParseError";
            case ErrorCode::IoError:           return "IoError";
            case ErrorCode::ConfigError:       return "ConfigError";
            case ErrorCode::EmptyResult:       return "EmptyResult";
            case ErrorCode::RegistrationError: return "RegistrationError";
            case ErrorCode::UnsupportedHost:   return "UnsupportedHost";
            case ErrorCode::InternalError:     return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message and optional context.
     *
     * The context usually carries the path that caused the error.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error permission_denied(std::string message, std::string context) {
            return {ErrorCode::PermissionDenied, std::move(message), std::move(context)};
        }

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error empty_result(std::string message, std::string context) {
            return {ErrorCode::EmptyResult, std::move(message), std::move(context)};
        }

        static Error registration_error(std::string message, std::string context) {
            return {ErrorCode::RegistrationError, std::move(message), std::move(context)};
        }

        static Error unsupported_host(std::string message) {
            return {ErrorCode::UnsupportedHost, std::move(message)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns a copy of this error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace classmap

#endif //CLASSMAP_ERROR_HPP
