#include "switchboard/common/json_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace switchboard::common {

namespace {

void append_utf8(std::string &out, unsigned long cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Position of the first character of the value bound to `field`, or npos.
std::size_t locate_value(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    const std::size_t after = json_skip_ws(json, key_pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return json_skip_ws(json, after + 1);
    }
    key_pos = json.find(quoted, key_pos + 1);
  }
  return std::string::npos;
}

std::string extract_nested(const std::string &json, const std::string &field, char open,
                           char close) {
  const std::size_t pos = locate_value(json, field);
  if (pos >= json.size() || json[pos] != open) {
    return "";
  }
  const std::size_t end = json_find_matching_token(json, pos, open, close);
  return end == std::string::npos ? "" : json.substr(pos, end - pos + 1);
}

std::size_t scan_scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char code = raw[++i];
    switch (code) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < raw.size()) {
        append_utf8(out, std::strtoul(raw.substr(i + 1, 4).c_str(), nullptr, 16));
        i += 4;
      }
      break;
    default:
      out.push_back(code);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = json_find_string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
    } else if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = locate_value(json, field);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const std::size_t end = json_find_string_end(json, pos);
  return end == std::string::npos ? "" : json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const std::size_t pos = locate_value(json, field);
  if (pos >= json.size() || json[pos] == '"' || json[pos] == '{' || json[pos] == '[') {
    return "";
  }
  return json.substr(pos, scan_scalar_end(json, pos) - pos);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return extract_nested(json, field, '{', '}');
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos < json.size() && json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
    if (pos >= json.size() || json[pos] != '"') {
      break;
    }
    const std::size_t key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    const char lead = json[pos];
    std::size_t end = std::string::npos;
    if (lead == '"') {
      end = json_find_string_end(json, pos);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, end - pos - 1));
      pos = end + 1;
    } else if (lead == '{' || lead == '[') {
      end = json_find_matching_token(json, pos, lead, lead == '{' ? '}' : ']');
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      end = scan_scalar_end(json, pos);
      result[key] = json.substr(pos, end - pos);
      pos = end;
    }
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  for (++pos; pos < array_json.size(); ++pos) {
    const char ch = array_json[pos];
    if (ch == ']') {
      break;
    }
    if (ch == '"') {
      pos = json_find_string_end(array_json, pos);
      if (pos == std::string::npos) {
        break;
      }
    } else if (ch == '{') {
      const std::size_t end = json_find_matching_token(array_json, pos, '{', '}');
      if (end == std::string::npos) {
        break;
      }
      out.push_back(array_json.substr(pos, end - pos + 1));
      pos = end;
    }
  }
  return out;
}

std::string json_number(const double value, const int precision) {
  if (!std::isfinite(value)) {
    return "0";
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
  return buf;
}

} // namespace switchboard::common
