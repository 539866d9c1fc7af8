#ifndef PSA_CORE_ERROR_H
#define PSA_CORE_ERROR_H

#include <cstdint>
#include <source_location>
#include <string>
#include <vector>

namespace psa::core {

    /**
     * Codes representing the failures the analyzer can report, from file I/O
     * and parsing to configuration and internal invariants.
     */
    enum class ErrorCode {
        SUCCESS = 0,

        FILE_NOT_FOUND,
        FILE_READ_ERROR,
        FILE_WRITE_ERROR,
        FILE_PARSE_ERROR,
        FILE_DECODE_ERROR,

        INVALID_PATH,
        INVALID_ARGUMENT,
        INVALID_CONFIG,
        INVALID_STATE,

        PARSE_ERROR,
        UNSUPPORTED_FORMAT,

        GRAPH_ERROR,
        CIRCULAR_DEPENDENCY,

        ANALYSIS_ERROR,
        RESOURCE_EXHAUSTED,

        INTERNAL_ERROR,
        UNKNOWN_ERROR
    };

    /**
     * Severity levels for errors or warnings.
     */
    enum class ErrorSeverity {
        WARNING,
        ERROR,
        FATAL
    };

    /**
     * Represents an error condition, with code, message, location, and optional suggestions / context.
     */
    struct Error {
        ErrorCode code{};                ///< The error code.
        std::string message{};           ///< Human-readable message describing the error.
        ErrorSeverity severity{};        ///< Severity level of this error.

        std::string file{};              ///< Source file in which the error was reported.
        uint_least32_t line{};           ///< Line number in the source file.
        std::string function{};          ///< Function name in which the error was reported.

        std::vector<std::string> suggestions{};  ///< Optional suggestions or fixes.
        std::string context{};                   ///< Optional additional context, e.g. the offending path.

        Error() = default;

        /**
         * Construct an error with code, message, severity, and source location inferred.
         *
         * @param code The error code.
         * @param message Description of what went wrong.
         * @param severity The severity (default is ERROR).
         * @param location Source location (default is current location).
         */
        Error(ErrorCode code,
              std::string message,
              ErrorSeverity severity = ErrorSeverity::ERROR,
              std::source_location location = std::source_location::current());

        /**
         * Construct an error including suggestions.
         *
         * @param code The error code.
         * @param message Description of what went wrong.
         * @param suggestions List of suggestion strings the user can try.
         * @param severity The severity (default is ERROR).
         * @param location Source location (default is current location).
         */
        Error(ErrorCode code,
              std::string message,
              std::vector<std::string> suggestions,
              ErrorSeverity severity = ErrorSeverity::ERROR,
              std::source_location location = std::source_location::current());

        /**
         * Get a human-readable representation of the error, including code, location and message.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] bool is_fatal() const;
    };

    /**
     * Convert an ErrorCode enum value to its string representation.
     */
    const char* error_code_to_string(ErrorCode code);

    /**
     * Map an error code to a default severity level.
     */
    ErrorSeverity error_code_to_severity(ErrorCode code);

    /**
     * Create an `Error` object from code and message, inferring source location.
     *
     * @param code The error code.
     * @param message Description of the error.
     * @param location Source location (default is current).
     * @return An `Error` instance with the default severity for @p code.
     */
    Error make_error(ErrorCode code,
                     std::string message,
                     std::source_location location = std::source_location::current());

    /**
     * Create an `Error` object that carries a context string (usually a file path).
     */
    Error make_error_with_context(ErrorCode code,
                                  std::string message,
                                  std::string context,
                                  std::source_location location = std::source_location::current());

}  // namespace psa::core

#endif //PSA_CORE_ERROR_H
