#pragma once

#include "switchboard/backends/traits.hpp"
#include "switchboard/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace switchboard::routing {

enum class GatewayErrorKind {
  BreakerOpen,
  NoBackendAvailable,
  BackendError,
  AllBackendsFailed,
  InvalidRequest,
  Canceled,
  RateLimited,
};

[[nodiscard]] std::string_view kind_name(GatewayErrorKind kind);

struct GatewayError {
  GatewayErrorKind kind = GatewayErrorKind::BackendError;
  std::string backend;
  std::string message;
  std::optional<backends::BackendError> cause;

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] int http_status() const;
};

template <typename T> using GatewayResult = common::Result<T, GatewayError>;

/// Circuit-open rejections become BreakerOpen, cancellations Canceled, anything else BackendError.
[[nodiscard]] GatewayError from_backend_error(const backends::BackendError &error);

} // namespace switchboard::routing
