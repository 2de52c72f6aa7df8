#pragma once
#include <stdexcept>
#include <string>

namespace ssmpatch {

// Base for every error the tools report.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid or empty schedule inputs, bad config values. Fatal, raised before any
// remote call.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Baseline document unreadable or malformed. Fatal.
class LoadError : public Error {
public:
    using Error::Error;
};

// No usable credentials or region. Fatal.
class AuthResolutionError : public Error {
public:
    using Error::Error;
};

// A single remote call was rejected (or never reached the remote system).
class RemoteOperationError : public Error {
public:
    RemoteOperationError(const std::string& operation, long status_code,
                         const std::string& error_type, const std::string& message)
        : Error(operation + " failed (HTTP " + std::to_string(status_code) + ")" +
                (error_type.empty() ? "" : " " + error_type) +
                (message.empty() ? "" : ": " + message)),
          operation_(operation), status_code_(status_code), error_type_(error_type) {}

    const std::string& operation() const { return operation_; }
    long status_code() const { return status_code_; }
    const std::string& error_type() const { return error_type_; }

private:
    std::string operation_;
    long status_code_;
    std::string error_type_;
};

} // namespace ssmpatch
