#include "client/GatewayBreakerStatus.hpp"
#include "common/Error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace svclink {

GatewayBreakerStatus::GatewayBreakerStatus(HttpTransport& t, std::string gatewayUrl, std::string serviceToken, std::chrono::milliseconds timeout)
    : transport {t},
      baseUrl {[&gatewayUrl] {
          while (!gatewayUrl.empty() && gatewayUrl.back() == '/') {
              gatewayUrl.pop_back();
          }
          return std::move(gatewayUrl);
      }()},
      token {std::move(serviceToken)},
      statusTimeout {timeout} {}

std::expected<CircuitBreaker::State, Error> GatewayBreakerStatus::remoteState(const std::string& circuitName) {
    HttpRequest request {
        "GET",
        baseUrl + "/internal/circuit-breaker/status/" + circuitName,
        {{"X-Service-Token", token}},
        {},
        std::nullopt,
        statusTimeout
    };
    auto response = transport.send(request);
    if (!response.has_value()) {
        return std::unexpected {response.error()};
    }
    if (response.value().status != 200) {
        return std::unexpected {Error::serviceUnavailable("gateway", "breaker status returned " + std::to_string(response.value().status), response.value().status)};
    }
    auto body = nlohmann::json::parse(response.value().body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("state") || !body["state"].is_string()) {
        return std::unexpected {Error {ErrorCode::InvalidResponse, "Malformed breaker status for " + circuitName}};
    }
    auto state = parseCircuitState(body["state"].get<std::string>());
    if (!state.has_value()) {
        return std::unexpected {Error {ErrorCode::InvalidResponse, "Unknown breaker state '" + body["state"].get<std::string>() + "' for " + circuitName}};
    }
    return state.value();
}

} // namespace svclink
