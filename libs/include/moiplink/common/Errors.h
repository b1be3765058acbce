#pragma once

#include "moiplink/common/Types.h"

#include <stdexcept>
#include <string>

namespace moiplink {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection refused/reset/closed. Retried by the supervisor, surfaced to
// the immediate caller as "unavailable".
class NetworkError : public Error {
public:
    using Error::Error;
};

class TimeoutError : public NetworkError {
public:
    using NetworkError::NetworkError;
};

// Bad credentials on either plane. Never retried immediately.
class AuthError : public Error {
public:
    using Error::Error;
};

// The device refused a command: `#...` on the line protocol or a non-2xx
// status on the management protocol. `status` is 0 for line-protocol errors.
class CommandRejected : public Error {
public:
    CommandRejected(std::string detail, int status = 0);

    const std::string& detail() const noexcept { return detail_; }
    int status() const noexcept { return status_; }

private:
    std::string detail_;
    int status_{0};
};

class CorrelationConflict : public Error {
public:
    CorrelationConflict(DeviceKind kind, int index);

    DeviceKind kind() const noexcept { return kind_; }
    int index() const noexcept { return index_; }

private:
    DeviceKind kind_;
    int index_;
};

class UnknownDevice : public Error {
public:
    using Error::Error;
};

class ProtocolViolation : public Error {
public:
    using Error::Error;
};

}  // namespace moiplink
