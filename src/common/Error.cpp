#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>

namespace svclink {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::ServiceUnavailable: return "ServiceUnavailable";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::GatewayError: return "GatewayError";
        case ErrorCode::ClientError: return "ClientError";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::MaxRetriesExceeded: return "MaxRetriesExceeded";
        case ErrorCode::ServiceDiscovery: return "ServiceDiscovery";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

const std::unordered_set<ErrorCode, ErrorCodeHash> nonRetriableErrorCodes = {
    ErrorCode::CircuitOpen,
    ErrorCode::MaxRetriesExceeded,
    ErrorCode::ServiceDiscovery,
    ErrorCode::InvalidConfiguration,
    ErrorCode::Cancelled,
};

bool isRetriable(const Error& error) {
    if (nonRetriableErrorCodes.contains(error.code)) {
        return false;
    }
    if (error.status >= 400 && error.status < 500 && error.status != 429) {
        return false;
    }
    return true;
}

Error::Error(const ErrorCode& c, std::string w)
    : code {c}, what {std::move(w)}, service {}, endpoint {}, status {0}, attempts {0}, type {}, correlationId {}, cause {} {}

Error::Error(const ErrorCode& c) : Error {c, toString(c)} {}

Error::Error(const proto::ErrorDetails& details)
    : Error {static_cast<ErrorCode>(details.code()), details.what()} {
    service = details.service();
    endpoint = details.endpoint();
    status = details.status();
}

Error Error::circuitOpen(const std::string& service, const std::string& circuit) {
    Error e {ErrorCode::CircuitOpen, "Circuit " + circuit + " for service " + service + " is OPEN"};
    e.service = service;
    return e;
}

Error Error::serviceUnavailable(const std::string& service, const std::string& reason, int status) {
    std::string message = "Service '" + service + "' is unavailable";
    if (!reason.empty()) {
        message += ": " + reason;
    }
    Error e {ErrorCode::ServiceUnavailable, message};
    e.service = service;
    e.status = status;
    return e;
}

Error Error::gatewayError(const std::string& type, const std::string& message, const std::optional<std::string>& correlationId, int status) {
    std::string text = type + ": " + message;
    if (correlationId.has_value()) {
        text += " (correlation_id: " + correlationId.value() + ")";
    }
    Error e {ErrorCode::GatewayError, text};
    e.type = type;
    e.correlationId = correlationId.value_or("");
    e.status = status;
    return e;
}

Error Error::clientError(int status, const std::string& text) {
    Error e {ErrorCode::ClientError, "Client error " + std::to_string(status) + ": " + text};
    e.status = status;
    return e;
}

Error Error::maxRetriesExceeded(const std::string& service, const std::string& endpoint, int attempts, const Error& last) {
    Error e {ErrorCode::MaxRetriesExceeded, "Max retries (" + std::to_string(attempts) + ") exceeded for " + service + ": " + endpoint};
    e.service = service;
    e.endpoint = endpoint;
    e.attempts = attempts;
    e.cause = std::make_shared<const Error>(last);
    return e;
}

Error Error::invalidConfiguration(const std::string& key, const std::string& value, const std::string& message) {
    if (!message.empty()) {
        return Error {ErrorCode::InvalidConfiguration, message};
    }
    return Error {ErrorCode::InvalidConfiguration, "Invalid configuration for key '" + key + "' with value '" + value + "'"};
}

Error Error::timeout(const std::string& service, const std::string& endpoint, std::chrono::milliseconds after) {
    Error e {ErrorCode::Timeout, "Request to " + service + endpoint + " timed out after " + std::to_string(after.count()) + " ms"};
    e.service = service;
    e.endpoint = endpoint;
    return e;
}

} // namespace svclink
