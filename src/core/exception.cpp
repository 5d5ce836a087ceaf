#include "phasecloud/core/exception.h"
#include <sstream>

namespace phasecloud {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_UNSUPPORTED_FORMAT:
            return "ERROR_UNSUPPORTED_FORMAT";
        case ResultCode::ERROR_SHAPE_MISMATCH:
            return "ERROR_SHAPE_MISMATCH";
        case ResultCode::ERROR_INSUFFICIENT_DATA:
            return "ERROR_INSUFFICIENT_DATA";
        case ResultCode::ERROR_FIT_DIVERGENCE:
            return "ERROR_FIT_DIVERGENCE";
        case ResultCode::ERROR_RENDER_FAILURE:
            return "ERROR_RENDER_FAILURE";
        case ResultCode::ERROR_EXTERNAL_TOOL:
            return "ERROR_EXTERNAL_TOOL";
        default:
            return "UNKNOWN_ERROR";
    }
}

int exitCodeFor(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return 0;
        case ResultCode::ERROR_INVALID_PARAMETER:
            return 2;
        case ResultCode::ERROR_FILE_NOT_FOUND:
        case ResultCode::ERROR_FILE_IO:
        case ResultCode::ERROR_UNSUPPORTED_FORMAT:
        case ResultCode::ERROR_SHAPE_MISMATCH:
            return 3;
        case ResultCode::ERROR_INSUFFICIENT_DATA:
            return 4;
        case ResultCode::ERROR_FIT_DIVERGENCE:
            return 5;
        case ResultCode::ERROR_RENDER_FAILURE:
        case ResultCode::ERROR_EXTERNAL_TOOL:
            return 6;
        default:
            return 1;
    }
}

} // namespace core
} // namespace phasecloud
