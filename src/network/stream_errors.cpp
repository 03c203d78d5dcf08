#include "network/stream_errors.hpp"

namespace cadence::network {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::NETWORK: return "NetworkError";
        case ErrorKind::CONFIGURATION: return "ConfigurationError";
        case ErrorKind::INITIALIZATION: return "InitializationFailed";
        case ErrorKind::SUBSCRIPTION: return "SubscriptionError";
        case ErrorKind::PARSE: return "ParseError";
    }
    return "Unknown";
}

std::string StreamError::describe() const {
    std::string out = to_string(kind) + ": " + message;
    if (http_status != 0) {
        out += " (HTTP " + std::to_string(http_status) + ")";
    }
    return out;
}

} // namespace cadence::network
