#include "errors.hpp"

namespace hc {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::InvalidState:
        return "InvalidState";
    case ErrorKind::ValidationError:
        return "ValidationError";
    case ErrorKind::InsufficientPayment:
        return "InsufficientPayment";
    case ErrorKind::SignerUnavailable:
        return "SignerUnavailable";
    case ErrorKind::IntegrityViolation:
        return "IntegrityViolation";
    }
    return "Unknown";
}

} // namespace hc
