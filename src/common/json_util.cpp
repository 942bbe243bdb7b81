#include "cmdgate/common/json_util.hpp"

#include <cstdint>
#include <functional>
#include <string_view>

namespace cmdgate::common {

namespace {

constexpr std::size_t kNpos = std::string::npos;

bool is_json_space(const char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; }

std::size_t skip_space(std::string_view json, std::size_t pos) {
  while (pos < json.size() && is_json_space(json[pos])) {
    ++pos;
  }
  return pos;
}

// `pos` is an opening quote; returns the index of the closing one.
std::size_t string_close(std::string_view json, const std::size_t pos) {
  for (std::size_t i = pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return kNpos;
}

// One past the end of the value starting at `pos`, or npos when it is malformed.
std::size_t value_end(std::string_view json, const std::size_t pos) {
  if (pos >= json.size()) {
    return kNpos;
  }
  const char first = json[pos];
  if (first == '"') {
    const auto close = string_close(json, pos);
    return close == kNpos ? kNpos : close + 1;
  }
  if (first == '{' || first == '[') {
    std::size_t depth = 0;
    for (std::size_t i = pos; i < json.size(); ++i) {
      const char ch = json[i];
      if (ch == '"') {
        i = string_close(json, i);
        if (i == kNpos) {
          return kNpos;
        }
      } else if (ch == '{' || ch == '[') {
        ++depth;
      } else if ((ch == '}' || ch == ']') && --depth == 0) {
        return i + 1;
      }
    }
    return kNpos;
  }
  std::size_t i = pos;
  while (i < json.size() && json[i] != ',' && json[i] != '}' && json[i] != ']' &&
         !is_json_space(json[i])) {
    ++i;
  }
  return i == pos ? kNpos : i;
}

// Calls `visit(key, raw_value)` for each member of the object in `json`; stops early when
// `visit` returns false.
void for_each_member(std::string_view json,
                     const std::function<bool(const std::string &, std::string_view)> &visit) {
  std::size_t pos = skip_space(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return;
  }
  pos = skip_space(json, pos + 1);
  while (pos < json.size() && json[pos] == '"') {
    const auto key_close = string_close(json, pos);
    if (key_close == kNpos) {
      return;
    }
    const std::string key = json_unescape(std::string(json.substr(pos + 1, key_close - pos - 1)));
    pos = skip_space(json, key_close + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return;
    }
    pos = skip_space(json, pos + 1);
    const auto end = value_end(json, pos);
    if (end == kNpos) {
      return;
    }
    if (!visit(key, json.substr(pos, end - pos))) {
      return;
    }
    pos = skip_space(json, end);
    if (pos >= json.size() || json[pos] != ',') {
      return;
    }
    pos = skip_space(json, pos + 1);
  }
}

std::string_view find_member(std::string_view json, const std::string &field) {
  std::string_view found;
  for_each_member(json, [&](const std::string &key, std::string_view value) {
    if (key == field) {
      found = value;
      return false;
    }
    return true;
  });
  return found;
}

std::string string_body(std::string_view quoted) {
  return json_unescape(std::string(quoted.substr(1, quoted.size() - 2)));
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  int continuation = 0;
  if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    continuation = 1;
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    continuation = 2;
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    continuation = 3;
  }
  for (int shift = (continuation - 1) * 6; shift >= 0; shift -= 6) {
    out.push_back(static_cast<char>(0x80U | ((cp >> static_cast<unsigned>(shift)) & 0x3FU)));
  }
}

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    std::uint32_t digit = 0;
    if (ch >= '0' && ch <= '9') {
      digit = static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      digit = static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      digit = static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
    out = (out << 4U) | digit;
  }
  return true;
}

} // namespace

std::string json_escape(const std::string &value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
      out.push_back(ch);
    } else if (ch == '\n') {
      out += "\\n";
    } else if (ch == '\r') {
      out += "\\r";
    } else if (ch == '\t') {
      out += "\\t";
    } else if (byte < 0x20U) {
      out += "\\u00";
      out.push_back(kHex[byte >> 4U]);
      out.push_back(kHex[byte & 0x0FU]);
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  std::size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] != '\\' || i + 1 == raw.size()) {
      out.push_back(raw[i++]);
      continue;
    }
    const char kind = raw[i + 1];
    i += 2;
    switch (kind) {
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
    case 'u': {
      std::uint32_t cp = 0;
      if (!read_hex4(raw, i, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      std::uint32_t low = 0;
      if (cp >= 0xD800U && cp <= 0xDBFFU && raw.compare(i, 2, "\\u") == 0 &&
          read_hex4(raw, i + 2, low) && low >= 0xDC00U && low <= 0xDFFFU) {
        cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
        i += 6;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(kind);
      break;
    }
  }
  return out;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto value = find_member(json, field);
  if (value.empty() || value.front() != '"') {
    return "";
  }
  return string_body(value);
}

bool json_get_bool(const std::string &json, const std::string &field, const bool fallback) {
  const auto value = find_member(json, field);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return fallback;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto value = find_member(json, field);
  return !value.empty() && value.front() == '{' ? std::string(value) : "";
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto value = find_member(json, field);
  return !value.empty() && value.front() == '[' ? std::string(value) : "";
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap fields;
  for_each_member(json, [&fields](const std::string &key, std::string_view value) {
    fields[key] = value.front() == '"' ? string_body(value) : std::string(value);
    return true;
  });
  return fields;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> objects;
  const std::string_view json(array_json);
  std::size_t pos = skip_space(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return objects;
  }
  pos = skip_space(json, pos + 1);
  while (pos < json.size() && json[pos] != ']') {
    const auto end = value_end(json, pos);
    if (end == kNpos) {
      break;
    }
    if (json[pos] == '{') {
      objects.emplace_back(json.substr(pos, end - pos));
    }
    pos = skip_space(json, end);
    if (pos < json.size() && json[pos] == ',') {
      pos = skip_space(json, pos + 1);
    }
  }
  return objects;
}

} // namespace cmdgate::common
