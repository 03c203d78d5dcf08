#pragma once

#include <stdexcept>
#include <string>

namespace cadence::network {

enum class ErrorKind {
    NONE,
    NETWORK,
    CONFIGURATION,
    INITIALIZATION,
    SUBSCRIPTION,
    PARSE
};

/**
 * Outcome detail filled in by operations that return bool.
 * http_status is the remote status code when the failure came from a
 * response, 0 otherwise.
 */
struct StreamError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    int http_status = 0;

    StreamError() = default;
    StreamError(ErrorKind k, std::string msg, int status = 0)
        : kind(k), message(std::move(msg)), http_status(status) {}

    void clear() {
        kind = ErrorKind::NONE;
        message.clear();
        http_status = 0;
    }

    std::string describe() const;
};

std::string to_string(ErrorKind kind);

// Fatal at construction: the configuration value is unusable
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Fatal at startup: a required resource could not be acquired
class InitializationFailed : public std::runtime_error {
public:
    explicit InitializationFailed(const std::string& what) : std::runtime_error(what) {}
};

} // namespace cadence::network
