#pragma once

#include "switchboard/common/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchboard::common {

/// Flat view of a TOML file: `[a.b]` + `k = v` is stored under "a.b.k" with the raw value text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::vector<std::string> sections;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Names of the `[prefix.<name>]` tables, in file order.
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &prefix) const;

private:
  [[nodiscard]] std::optional<std::string> raw(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace switchboard::common
