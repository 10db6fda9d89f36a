#pragma once

#include "switchboard/backends/traits.hpp"
#include "switchboard/common/clock.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace switchboard::cache {

/// Message text longer than this is replaced by its SHA-256 digest inside cache keys.
inline constexpr std::size_t MAX_KEY_TEXT_BYTES = 256;

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// agent | model | role:text ... . Any difference in agent, model or messages yields a new key.
[[nodiscard]] std::string build_cache_key(const backends::CompletionRequest &request,
                                          const std::string &resolved_model);

/// Exact-match memo of completed responses. Entries are visible while now < expiry;
/// expired entries are treated as absent and only dropped when overwritten.
class ResponseCache {
public:
  explicit ResponseCache(std::chrono::seconds ttl, common::Clock clock = common::system_clock());

  void set(const std::string &key, const backends::CompletionResponse &response);
  void set(const std::string &key, const backends::CompletionResponse &response,
           common::TimePoint expires_at);
  [[nodiscard]] std::optional<backends::CompletionResponse> get(const std::string &key) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

private:
  struct Entry {
    backends::CompletionResponse response;
    common::TimePoint expires_at;
  };

  const std::chrono::seconds ttl_;
  const common::Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace switchboard::cache
