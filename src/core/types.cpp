#include "types.hpp"

std::string to_string(ErrorClass c) {
    switch (c) {
        case ErrorClass::None:                return "none";
        case ErrorClass::Transient:           return "transient";
        case ErrorClass::RemoteRejected:      return "remote_rejected";
        case ErrorClass::LocalIOFailure:      return "local_io_failure";
        case ErrorClass::OversizedSource:     return "oversized_source";
        case ErrorClass::PermanentlyTooLarge: return "permanently_too_large";
        case ErrorClass::Cancelled:           return "cancelled";
    }
    return "none";
}

ErrorClass error_class_from_string(const std::string& s) {
    if (s == "transient")             return ErrorClass::Transient;
    if (s == "remote_rejected")       return ErrorClass::RemoteRejected;
    if (s == "local_io_failure")      return ErrorClass::LocalIOFailure;
    if (s == "oversized_source")      return ErrorClass::OversizedSource;
    if (s == "permanently_too_large") return ErrorClass::PermanentlyTooLarge;
    if (s == "cancelled")             return ErrorClass::Cancelled;
    return ErrorClass::None;
}

std::string to_string(Direction d) {
    return d == Direction::Upload ? "upload" : "download";
}

Direction direction_from_string(const std::string& s) {
    return s == "download" ? Direction::Download : Direction::Upload;
}
