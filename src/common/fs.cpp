#include "switchboard/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace switchboard::common {

namespace {

bool is_space(unsigned char c) { return std::isspace(c) != 0; }

} // namespace

std::string trim(const std::string &input) {
  const auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  const auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (auto &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure("HOME is not set");
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string>::success(buffer.str());
}

std::string expand_path(std::string value) {
  if (!value.empty() && value.front() == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_ref(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::string out;
  auto cursor = value.cbegin();
  for (std::sregex_iterator it(value.begin(), value.end(), env_ref), end; it != end; ++it) {
    const auto &match = *it;
    out.append(cursor, match[0].first);
    if (const char *var = std::getenv(match[1].str().c_str()); var != nullptr) {
      out += var;
    }
    cursor = match[0].second;
  }
  out.append(cursor, value.cend());
  return out;
}

} // namespace switchboard::common
