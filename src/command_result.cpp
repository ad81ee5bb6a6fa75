///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "command_result.hpp"


///////////////////////////
///       ERRORS        ///
///////////////////////////
const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PERMISSION_DENIED:   return "PERMISSION_DENIED";
        case ErrorKind::SLOT_BLOCKED:        return "SLOT_BLOCKED";
        case ErrorKind::NOT_FOUND:           return "NOT_FOUND";
        case ErrorKind::CONFLICT:            return "CONFLICT";
        case ErrorKind::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case ErrorKind::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ErrorKind::ALREADY_SCHEDULED:   return "ALREADY_SCHEDULED";
        case ErrorKind::SCHEDULE_FULL:       return "SCHEDULE_FULL";
        case ErrorKind::CANCELLED:           return "CANCELLED";
        case ErrorKind::OPTIMIZER_FAILED:    return "OPTIMIZER_FAILED";
    }
    return "UNKNOWN";
}
