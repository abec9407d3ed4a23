#ifndef GENERIC_BLOOM_TRACEABLEEXCEPTION_HPP
#define GENERIC_BLOOM_TRACEABLEEXCEPTION_HPP

#include <exception>
#include <string>

#include "ErrorCode.hpp"

namespace generic_bloom {
/**
 * Base class for exceptions that carry an error code and the source location they were thrown
 * from. Subclasses are typically declared as nested `OperationFailed` types.
 */
class TraceableException : public std::exception {
public:
    // Constructors
    TraceableException(ErrorCode error_code, char const* const filename, int line_number)
            : m_error_code(error_code),
              m_filename(filename),
              m_line_number(line_number),
              m_message(build_message(error_code, filename, line_number, {})) {}

    TraceableException(
            ErrorCode error_code,
            char const* const filename,
            int line_number,
            std::string const& context
    )
            : m_error_code(error_code),
              m_filename(filename),
              m_line_number(line_number),
              m_message(build_message(error_code, filename, line_number, context)) {}

    // Methods
    [[nodiscard]] auto get_error_code() const -> ErrorCode { return m_error_code; }

    [[nodiscard]] auto get_filename() const -> char const* { return m_filename; }

    [[nodiscard]] auto get_line_number() const -> int { return m_line_number; }

    [[nodiscard]] auto what() const noexcept -> char const* override { return m_message.c_str(); }

private:
    static auto build_message(
            ErrorCode error_code,
            char const* filename,
            int line_number,
            std::string const& context
    ) -> std::string {
        std::string message{get_error_code_description(error_code)};
        if (false == context.empty()) {
            message += ": ";
            message += context;
        }
        message += " (";
        message += filename;
        message += ":";
        message += std::to_string(line_number);
        message += ")";
        return message;
    }

    ErrorCode m_error_code;
    char const* m_filename;
    int m_line_number;
    std::string m_message;
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_TRACEABLEEXCEPTION_HPP
