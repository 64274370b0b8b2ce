/**
 * @file Error.cpp
 * @brief Error code names and Error::format().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <astro/core/Error.hpp>

#include <sstream>

namespace astro::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:            return "None";
        case ErrorCode::kInvalidArgument: return "InvalidArgument";
        case ErrorCode::kInvalidState:    return "InvalidState";
        case ErrorCode::kOutOfMemory:     return "OutOfMemory";
        case ErrorCode::kOutOfRange:      return "OutOfRange";
        case ErrorCode::kNotFound:        return "NotFound";
        case ErrorCode::kInternalError:   return "InternalError";
    }
    return "Unknown";
}

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message
       << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace astro::core
