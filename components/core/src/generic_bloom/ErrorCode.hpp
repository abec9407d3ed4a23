#ifndef GENERIC_BLOOM_ERRORCODE_HPP
#define GENERIC_BLOOM_ERRORCODE_HPP

namespace generic_bloom {
typedef enum {
    ErrorCodeSuccess = 0,
    ErrorCodeBadParam,
    ErrorCodeUnsupported,
    ErrorCodeFileNotFound,
    ErrorCodeFailure,
} ErrorCode;

/**
 * @param error_code
 * @return A short human-readable description of the error code
 */
constexpr auto get_error_code_description(ErrorCode error_code) -> char const* {
    switch (error_code) {
        case ErrorCodeSuccess:
            return "success";
        case ErrorCodeBadParam:
            return "bad parameter";
        case ErrorCodeUnsupported:
            return "operation not supported";
        case ErrorCodeFileNotFound:
            return "file not found";
        case ErrorCodeFailure:
            return "failure";
    }
    return "unknown error";
}
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_ERRORCODE_HPP
