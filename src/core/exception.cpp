#include "handcad/core/exception.h"
#include <sstream>

namespace handcad {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        // Throw sites pass __FILE__:__LINE__; keep only the file name
        const size_t slash = context.find_last_of("/\\");
        oss << " (at " << (slash == std::string::npos ? context : context.substr(slash + 1)) << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:                 return "SUCCESS";
        case ResultCode::ERROR_INVALID_LANDMARKS: return "ERROR_INVALID_LANDMARKS";
        case ResultCode::ERROR_NOT_INITIALIZED:   return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_CONFIG_INVALID:    return "ERROR_CONFIG_INVALID";
        case ResultCode::ERROR_THREAD_FAILURE:    return "ERROR_THREAD_FAILURE";
    }
    return "UNKNOWN_ERROR";
}

} // namespace core
} // namespace handcad
