#include "switchboard/routing/errors.hpp"

#include <sstream>

namespace switchboard::routing {

std::string_view kind_name(const GatewayErrorKind kind) {
  switch (kind) {
  case GatewayErrorKind::BreakerOpen:
    return "breaker_open";
  case GatewayErrorKind::NoBackendAvailable:
    return "no_backend_available";
  case GatewayErrorKind::BackendError:
    return "backend_error";
  case GatewayErrorKind::AllBackendsFailed:
    return "all_backends_failed";
  case GatewayErrorKind::InvalidRequest:
    return "invalid_request";
  case GatewayErrorKind::Canceled:
    return "canceled";
  case GatewayErrorKind::RateLimited:
    return "rate_limited";
  }
  return "backend_error";
}

std::string GatewayError::to_string() const {
  std::ostringstream out;
  out << kind_name(kind);
  if (!backend.empty()) {
    out << " [" << backend << "]";
  }
  if (!message.empty()) {
    out << ": " << message;
  }
  if (cause.has_value()) {
    out << " (" << cause->to_string() << ")";
  }
  return out.str();
}

int GatewayError::http_status() const {
  switch (kind) {
  case GatewayErrorKind::BreakerOpen:
  case GatewayErrorKind::NoBackendAvailable:
    return 503;
  case GatewayErrorKind::BackendError:
  case GatewayErrorKind::AllBackendsFailed:
    return 502;
  case GatewayErrorKind::InvalidRequest:
    return 400;
  case GatewayErrorKind::RateLimited:
    return 429;
  case GatewayErrorKind::Canceled:
    return 499;
  }
  return 500;
}

GatewayError from_backend_error(const backends::BackendError &error) {
  GatewayErrorKind kind = GatewayErrorKind::BackendError;
  std::string message = "backend call failed";
  if (error.code == backends::BackendErrorCode::CircuitOpen) {
    kind = GatewayErrorKind::BreakerOpen;
    message = "circuit breaker open";
  } else if (error.code == backends::BackendErrorCode::Canceled) {
    kind = GatewayErrorKind::Canceled;
    message = "request canceled";
  }
  return GatewayError{
      .kind = kind, .backend = error.backend, .message = std::move(message), .cause = error};
}

} // namespace switchboard::routing
