#pragma once

#include "switchboard/backends/traits.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/config/schema.hpp"

#include <map>
#include <memory>
#include <string>

namespace switchboard::backends {

using BackendMap = std::map<std::string, std::shared_ptr<Backend>>;

[[nodiscard]] common::Result<std::shared_ptr<Backend>>
create_backend(const config::BackendConfig &backend, std::shared_ptr<HttpClient> http_client);

/// Builds every enabled backend in the config, keyed by id.
[[nodiscard]] common::Result<BackendMap> create_backends(const config::Config &config,
                                                         std::shared_ptr<HttpClient> http_client);

} // namespace switchboard::backends
