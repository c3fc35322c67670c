#pragma once

#include <stdexcept>
#include <string>

enum class StatusCode {
    Cancelled,
    Unauthenticated,
    Unavailable,
    InvalidArgument,
    NotFound,
    Internal,
    Unknown
};

const char* StatusCodeToString(StatusCode code);
StatusCode StatusCodeFromString(const std::string& name);

// Failure of a remote call. Thrown by transports and propagated by
// RetryingRpcClient.
class RpcError : public std::runtime_error {
public:
    RpcError(StatusCode code, const std::string& message)
        : std::runtime_error(message), _code(code), _sessionInvalidated(false) {}

    StatusCode Code() const { return _code; }
    bool IsCancelled() const { return _code == StatusCode::Cancelled; }
    bool IsUnauthenticated() const { return _code == StatusCode::Unauthenticated; }

    // Set when the token refresh after an Unauthenticated failure failed too;
    // the user has to sign in again.
    bool IsSessionInvalidated() const { return _sessionInvalidated; }
    void MarkSessionInvalidated() { _sessionInvalidated = true; }

private:
    StatusCode _code;
    bool _sessionInvalidated;
};
