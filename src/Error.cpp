/**
 * Error.cpp - Error code names
 */

#include "lh/Error.hpp"

namespace lh {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NO_COMMAND:            return "NoCommand";
        case ErrorCode::API_REQUEST_FAILED:    return "APIRequestFailed";
        case ErrorCode::INVALID_JSON_RESPONSE: return "InvalidJSONResponse";
        case ErrorCode::NO_COMMAND_TO_EXECUTE: return "NoCommandToExecute";
    }
    return "UnknownError";
}

} // namespace lh
