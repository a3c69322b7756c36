#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AUTH:              return "authentication failed";
        case ErrorKind::TIMEOUT:           return "timed out";
        case ErrorKind::TOOL_UNAVAILABLE:  return "tool unavailable";
        case ErrorKind::VALIDATION:        return "invalid request";
        case ErrorKind::PROCESS:           return "process failed";
        case ErrorKind::CANCELLED:         return "cancelled";
        case ErrorKind::PERMISSION_DENIED: return "permission denied";
        case ErrorKind::NOT_SUPPORTED:     return "not supported";
        case ErrorKind::UNAVAILABLE:       return "unavailable";
        case ErrorKind::NOT_FOUND:         return "not found";
    }
    return "error";
}
