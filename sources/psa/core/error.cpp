#include "psa/core/error.h"
#include <sstream>

namespace psa::core {

    Error::Error(const ErrorCode code,
                 std::string message,
                 const ErrorSeverity severity,
                 const std::source_location location)
        : code(code)
        , message(std::move(message))
        , severity(severity)
        , file(location.file_name())
        , line(location.line())
        , function(location.function_name()) {
    }

    Error::Error(const ErrorCode code,
                 std::string message,
                 std::vector<std::string> suggestions,
                 const ErrorSeverity severity,
                 const std::source_location location)
        : Error(code, std::move(message), severity, location) {
        this->suggestions = std::move(suggestions);
    }

    // Rendered like a compiler diagnostic: "<path>: <severity>: <kind>: <message>".
    // The C++ origin is only shown for fatal errors, which indicate a bug.
    std::string Error::to_string() const {
        std::ostringstream ss;

        if (!context.empty()) {
            ss << context << ": ";
        }

        switch (severity) {
            case ErrorSeverity::WARNING: ss << "warning: "; break;
            case ErrorSeverity::ERROR: ss << "error: "; break;
            case ErrorSeverity::FATAL: ss << "fatal: "; break;
        }

        ss << error_code_to_string(code) << ": " << message;

        for (const auto& suggestion : suggestions) {
            ss << "\n  hint: " << suggestion;
        }

        if (is_fatal()) {
            ss << "\n  raised at " << file << ":" << line << " (" << function << ")";
        }

        return ss.str();
    }

    bool Error::is_fatal() const {
        return severity == ErrorSeverity::FATAL;
    }

    const char* error_code_to_string(const ErrorCode code) {
        switch (code) {
            case ErrorCode::SUCCESS: return "Success";
            case ErrorCode::FILE_NOT_FOUND: return "File not found";
            case ErrorCode::FILE_READ_ERROR: return "File read error";
            case ErrorCode::FILE_WRITE_ERROR: return "File write error";
            case ErrorCode::FILE_PARSE_ERROR: return "Python syntax error";
            case ErrorCode::FILE_DECODE_ERROR: return "Source decode error";
            case ErrorCode::INVALID_PATH: return "Invalid path";
            case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
            case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
            case ErrorCode::INVALID_STATE: return "Invalid state";
            case ErrorCode::PARSE_ERROR: return "Parse error";
            case ErrorCode::UNSUPPORTED_FORMAT: return "Unsupported format";
            case ErrorCode::GRAPH_ERROR: return "Import graph error";
            case ErrorCode::CIRCULAR_DEPENDENCY: return "Circular import";
            case ErrorCode::ANALYSIS_ERROR: return "Analysis error";
            case ErrorCode::RESOURCE_EXHAUSTED: return "Resource exhausted";
            case ErrorCode::INTERNAL_ERROR: return "Internal error";
            case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        }
        return "Unknown error code";
    }

    ErrorSeverity error_code_to_severity(const ErrorCode code) {
        switch (code) {
            case ErrorCode::SUCCESS:
                return ErrorSeverity::WARNING;

            case ErrorCode::RESOURCE_EXHAUSTED:
            case ErrorCode::INTERNAL_ERROR:
                return ErrorSeverity::FATAL;

            // A file the analyzer cannot read or parse is skipped, the run goes on.
            case ErrorCode::FILE_NOT_FOUND:
            case ErrorCode::FILE_PARSE_ERROR:
            case ErrorCode::FILE_DECODE_ERROR:
            case ErrorCode::UNSUPPORTED_FORMAT:
                return ErrorSeverity::WARNING;

            default:
                return ErrorSeverity::ERROR;
        }
    }

    Error make_error(const ErrorCode code,
                     std::string message,
                     const std::source_location location) {
        return Error{code, std::move(message), error_code_to_severity(code), location};
    }

    Error make_error_with_context(const ErrorCode code,
                                  std::string message,
                                  std::string context,
                                  const std::source_location location) {
        Error error{code, std::move(message), error_code_to_severity(code), location};
        error.context = std::move(context);
        return error;
    }

} // namespace psa::core
