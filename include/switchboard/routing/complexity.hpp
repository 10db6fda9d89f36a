#pragma once

#include "switchboard/backends/traits.hpp"

namespace switchboard::routing {

/// Additive 0..1 estimate of how demanding a request is:
///   characters   >8000 +0.3, >4000 +0.2, >2000 +0.1
///   messages     >10 +0.2, >5 +0.1
///   system text  reasoning keywords +0.2, code keywords +0.15 (case-insensitive)
///   max tokens   >4000 +0.15, >2000 +0.1
[[nodiscard]] double complexity_score(const backends::CompletionRequest &request);

} // namespace switchboard::routing
