#include "switchboard/common/toml.hpp"

#include "switchboard/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace switchboard::common {

namespace {

bool is_unescaped_quote(const std::string &text, std::size_t i) {
  return text[i] == '"' && (i == 0 || text[i - 1] != '\\');
}

std::string strip_comment(const std::string &line) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (is_unescaped_quote(line, i)) {
      quoted = !quoted;
    } else if (!quoted && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string &value) {
  std::string text = trim(value);
  if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
    return text;
  }
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 1; i + 1 < text.size(); ++i) {
    if (text[i] == '\\' && i + 2 < text.size()) {
      ++i;
      out.push_back(text[i] == 'n' ? '\n' : text[i] == 't' ? '\t' : text[i]);
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

template <typename Int> std::optional<Int> parse_integral(const std::string &text) {
  Int parsed{};
  const auto *first = text.data();
  const auto *last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

std::optional<std::string> TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return trim(it->second);
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto value = raw(key);
  return value ? unquote(*value) : fallback;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto value = raw(key);
  if (!value) {
    return fallback;
  }
  if (*value == "true") {
    return true;
  }
  if (*value == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, const int fallback) const {
  const auto value = raw(key);
  if (!value) {
    return fallback;
  }
  return parse_integral<int>(*value).value_or(fallback);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto value = raw(key);
  if (!value) {
    return fallback;
  }
  return parse_integral<std::uint64_t>(*value).value_or(fallback);
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto value = raw(key);
  if (!value || value->empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value->c_str(), &end);
  if (end != value->c_str() + value->size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto value = raw(key);
  if (!value || value->size() < 2 || value->front() != '[' || value->back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  std::string element;
  bool quoted = false;
  const std::string body = value->substr(1, value->size() - 2);
  for (std::size_t i = 0; i <= body.size(); ++i) {
    if (i == body.size() || (!quoted && body[i] == ',')) {
      if (!trim(element).empty()) {
        out.push_back(unquote(element));
      }
      element.clear();
      continue;
    }
    if (is_unescaped_quote(body, i)) {
      quoted = !quoted;
    }
    element.push_back(body[i]);
  }
  return out;
}

std::vector<std::string> TomlDocument::child_tables(const std::string &prefix) const {
  std::vector<std::string> names;
  const std::string head = prefix + ".";
  for (const auto &section : sections) {
    if (!starts_with(section, head)) {
      continue;
    }
    const std::string name = section.substr(head.size());
    if (!name.empty() && name.find('.') == std::string::npos &&
        std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  }
  return names;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string text = trim(strip_comment(line));
    if (text.empty()) {
      continue;
    }

    if (text.front() == '[' && text.back() == ']') {
      section = trim(text.substr(1, text.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      document.sections.push_back(section);
      continue;
    }

    const auto eq = text.find('=');
    const std::string key = eq == std::string::npos ? "" : trim(text.substr(0, eq));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] = trim(text.substr(eq + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace switchboard::common
