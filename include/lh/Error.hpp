/**
 * Error.hpp - Error codes and exception type for fatal pipeline failures
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lh {

enum class ErrorCode {
    NO_COMMAND,              // Empty argument list
    API_REQUEST_FAILED,      // Transport failure or non-2xx status
    INVALID_JSON_RESPONSE,   // Body not parseable against the chat schema
    NO_COMMAND_TO_EXECUTE    // Recommended command splits to nothing
};

const char* errorCodeName(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace lh
