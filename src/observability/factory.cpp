#include "switchboard/observability/factory.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/observability/log_observer.hpp"
#include "switchboard/observability/multi_observer.hpp"
#include "switchboard/observability/noop_observer.hpp"

#include <sstream>

namespace switchboard::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &kind) {
  if (kind.empty() || kind == "none" || kind == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi->add(create_single(common::trim(part)));
  }
  return multi;
}

} // namespace switchboard::observability
