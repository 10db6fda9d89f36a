#include "switchboard/cache/response_cache.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace switchboard::cache {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (const unsigned char byte : digest) {
    out << std::setw(2) << static_cast<int>(byte);
  }
  return out.str();
}

std::string build_cache_key(const backends::CompletionRequest &request,
                            const std::string &resolved_model) {
  std::string key = request.agent_id;
  key += '|';
  key += resolved_model;
  for (const auto &message : request.messages) {
    key += '|';
    key += backends::role_name(message.role);
    key += ':';
    if (message.text.size() > MAX_KEY_TEXT_BYTES) {
      key += "sha256=" + sha256_hex(message.text);
    } else {
      key += std::to_string(message.text.size());
      key += '=';
      key += message.text;
    }
  }
  return key;
}

ResponseCache::ResponseCache(const std::chrono::seconds ttl, common::Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

void ResponseCache::set(const std::string &key, const backends::CompletionResponse &response) {
  set(key, response, clock_() + ttl_);
}

void ResponseCache::set(const std::string &key, const backends::CompletionResponse &response,
                        const common::TimePoint expires_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = Entry{response, expires_at};
}

std::optional<backends::CompletionResponse> ResponseCache::get(const std::string &key) const {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  if (it == entries_.end() || !(now < it->second.expires_at)) {
    return std::nullopt;
  }
  return it->second.response;
}

std::size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace switchboard::cache
