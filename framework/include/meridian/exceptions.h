#ifndef MERIDIAN_EXCEPTIONS_H
#define MERIDIAN_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace meridian {

/**
 * @brief Base class for all errors raised by Meridian.
 */
class MeridianError : public std::runtime_error {
public:
    explicit MeridianError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Invalid configuration values or environment entries. */
class ConfigError : public MeridianError {
public:
    explicit ConfigError(const std::string& msg) : MeridianError(msg) {}
};

/** @brief The endpoint file could not be read or parsed. */
class ConfigLoadFailed : public MeridianError {
public:
    explicit ConfigLoadFailed(const std::string& msg) : MeridianError(msg) {}
};

/**
 * @brief Failure raised by a region client.
 * Carries the HTTP status when one was received, 0 for network errors and timeouts.
 */
class InvocationError : public MeridianError {
    int status_code_;
public:
    InvocationError(int status, const std::string& msg)
        : MeridianError(msg), status_code_(status) {}

    int status() const { return status_code_; }
};

/** @brief Caller-side fault: the request or its parameters were rejected. */
class ValidationError : public InvocationError {
public:
    explicit ValidationError(const std::string& msg, int status = 400) : InvocationError(status, msg) {}
};

/** @brief Endpoint-side fault: service error, throttling, network failure or timeout. */
class TransportFailure : public InvocationError {
public:
    explicit TransportFailure(const std::string& msg, int status = 0) : InvocationError(status, msg) {}
};

/** @brief A response stream broke before reaching its end. */
class StreamError : public MeridianError {
public:
    explicit StreamError(const std::string& msg) : MeridianError(msg) {}
};

} // namespace meridian

#endif
