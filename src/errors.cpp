#include "objdet/errors.hpp"

namespace objdet {

int httpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotReady:
        case ErrorKind::ServiceUnavailable:
            return 503;
        case ErrorKind::Decode:
        case ErrorKind::InvalidUpload:
            return 400;
        case ErrorKind::InvalidParameter:
            return 422;
        case ErrorKind::PayloadTooLarge:
            return 413;
        case ErrorKind::Internal:
        case ErrorKind::Load:
        case ErrorKind::UnknownClass:
        case ErrorKind::Contract:
        case ErrorKind::Config:
            break;
    }
    return 500;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Internal:           return "internal";
        case ErrorKind::Load:               return "load";
        case ErrorKind::NotReady:           return "not_ready";
        case ErrorKind::ServiceUnavailable: return "service_unavailable";
        case ErrorKind::Decode:             return "decode";
        case ErrorKind::InvalidParameter:   return "invalid_parameter";
        case ErrorKind::InvalidUpload:      return "invalid_upload";
        case ErrorKind::PayloadTooLarge:    return "payload_too_large";
        case ErrorKind::UnknownClass:       return "unknown_class";
        case ErrorKind::Contract:           return "contract";
        case ErrorKind::Config:             return "config";
    }
    return "internal";
}

} // namespace objdet
