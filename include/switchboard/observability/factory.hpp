#pragma once

#include "switchboard/config/schema.hpp"
#include "switchboard/observability/observer.hpp"

#include <memory>

namespace switchboard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace switchboard::observability
