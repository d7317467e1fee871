#pragma once

#include <stdexcept>
#include <string>

namespace hc {

enum class ErrorKind {
    NotFound,
    InvalidState,
    ValidationError,
    InsufficientPayment,
    SignerUnavailable,
    IntegrityViolation
};

const char* errorKindName(ErrorKind kind);

// Every failure the engine reports to its caller. Randomness and libsodium
// initialization failures stay plain std::runtime_error (fatal).
class GameError : public std::runtime_error {
public:
    GameError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace hc
