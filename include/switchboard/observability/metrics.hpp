#pragma once

#include "switchboard/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace switchboard::observability {

// Hook points used by routers and the gateway. Pass a NoopObserver to disable.

void record_request(IObserver &observer, const std::string &backend, const std::string &model,
                    const std::string &agent_id, const std::string &cache_status,
                    std::chrono::milliseconds duration);
void record_cost(IObserver &observer, const std::string &backend, const std::string &model,
                 double usd);
void record_tokens(IObserver &observer, const std::string &kind, const std::string &backend,
                   const std::string &model, std::uint64_t count);
void update_cache_hit_rate(IObserver &observer, const std::string &agent_id, double ratio);
void record_provider_error(IObserver &observer, const std::string &backend,
                           const std::string &message = "");
void record_error(IObserver &observer, const std::string &component, const std::string &message);

} // namespace switchboard::observability
