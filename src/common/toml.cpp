#include "cmdgate/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace cmdgate::common {

namespace {

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-' ||
         ch == '.';
}

// Single pass over the whole text; tracks the line for error messages.
class TomlReader {
public:
  explicit TomlReader(const std::string &text) : text_(text) {}

  Result<TomlDocument> read() {
    TomlDocument document;
    std::string section;
    while (true) {
      skip_blank_lines();
      if (at_end()) {
        break;
      }
      if (peek() == '[') {
        auto header = read_section_header();
        if (!header.ok()) {
          return Result<TomlDocument>::failure(header.error());
        }
        section = header.take();
      } else {
        auto key = read_key();
        if (!key.ok()) {
          return Result<TomlDocument>::failure(key.error());
        }
        skip_spaces();
        if (!consume('=')) {
          return fail<TomlDocument>("expected '=' after key '" + key.value() + "'");
        }
        skip_spaces();
        const std::size_t value_line = line_;
        auto value = read_value();
        if (!value.ok()) {
          return Result<TomlDocument>::failure(value.error());
        }
        const std::string full_key = section.empty() ? key.value() : section + "." + key.value();
        if (auto status = document.insert(full_key, value.take()); !status.ok()) {
          return Result<TomlDocument>::failure(status.error() + " at line " +
                                               std::to_string(value_line));
        }
      }
      if (auto status = expect_line_end(); !status.ok()) {
        return Result<TomlDocument>::failure(status.error());
      }
    }
    return Result<TomlDocument>::success(std::move(document));
  }

private:
  template <typename T> Result<T> fail(const std::string &what) const {
    return Result<T>::failure(what + " at line " + std::to_string(line_));
  }

  [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }

  char advance() {
    const char ch = text_[pos_++];
    if (ch == '\n') {
      ++line_;
    }
    return ch;
  }

  bool consume(const char expected) {
    if (peek() != expected) {
      return false;
    }
    advance();
    return true;
  }

  void skip_spaces() {
    while (!at_end() && (peek() == ' ' || peek() == '\t')) {
      advance();
    }
  }

  void skip_comment() {
    if (peek() == '#') {
      while (!at_end() && peek() != '\n') {
        advance();
      }
    }
  }

  void skip_blank_lines() {
    while (!at_end()) {
      skip_spaces();
      skip_comment();
      if (peek() == '\r' || peek() == '\n') {
        advance();
        continue;
      }
      return;
    }
  }

  // Inside arrays newlines and comments are insignificant.
  void skip_array_filler() {
    while (!at_end()) {
      skip_spaces();
      skip_comment();
      if (peek() == '\r' || peek() == '\n') {
        advance();
        continue;
      }
      return;
    }
  }

  Status expect_line_end() {
    skip_spaces();
    skip_comment();
    consume('\r');
    if (at_end() || consume('\n')) {
      return Status::success();
    }
    return Status::error("unexpected text after value at line " + std::to_string(line_));
  }

  Result<std::string> read_section_header() {
    advance(); // '['
    skip_spaces();
    std::string name;
    while (!at_end() && is_bare_key_char(peek())) {
      name.push_back(advance());
    }
    skip_spaces();
    if (!consume(']')) {
      return fail<std::string>("unterminated section header");
    }
    if (name.empty() || name.front() == '.' || name.back() == '.') {
      return fail<std::string>("invalid section name '" + name + "'");
    }
    return Result<std::string>::success(std::move(name));
  }

  Result<std::string> read_key() {
    if (peek() == '"') {
      return read_basic_string();
    }
    std::string key;
    while (!at_end() && is_bare_key_char(peek())) {
      key.push_back(advance());
    }
    if (key.empty()) {
      return fail<std::string>("expected a key");
    }
    return Result<std::string>::success(std::move(key));
  }

  Result<TomlValue> read_value() {
    const char ch = peek();
    if (ch == '"' || ch == '\'') {
      auto text = ch == '"' ? read_basic_string() : read_literal_string();
      if (!text.ok()) {
        return Result<TomlValue>::failure(text.error());
      }
      return Result<TomlValue>::success(TomlValue{text.take()});
    }
    if (ch == '[') {
      return read_string_array();
    }
    return read_scalar();
  }

  Result<std::string> read_basic_string() {
    advance(); // opening quote
    std::string out;
    while (true) {
      if (at_end() || peek() == '\n') {
        return fail<std::string>("unterminated string");
      }
      const char ch = advance();
      if (ch == '"') {
        return Result<std::string>::success(std::move(out));
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (at_end()) {
        return fail<std::string>("unterminated string");
      }
      switch (const char escaped = advance()) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
      case '\\':
        out.push_back(escaped);
        break;
      default:
        return fail<std::string>(std::string("unsupported escape '\\") + escaped + "'");
      }
    }
  }

  Result<std::string> read_literal_string() {
    advance(); // opening quote
    std::string out;
    while (true) {
      if (at_end() || peek() == '\n') {
        return fail<std::string>("unterminated string");
      }
      const char ch = advance();
      if (ch == '\'') {
        return Result<std::string>::success(std::move(out));
      }
      out.push_back(ch);
    }
  }

  Result<TomlValue> read_string_array() {
    const std::size_t started_at = line_;
    advance(); // '['
    std::vector<std::string> items;
    while (true) {
      skip_array_filler();
      if (at_end()) {
        return Result<TomlValue>::failure("unterminated array starting at line " +
                                          std::to_string(started_at));
      }
      if (consume(']')) {
        return Result<TomlValue>::success(TomlValue{std::move(items)});
      }
      if (peek() != '"' && peek() != '\'') {
        return fail<TomlValue>("arrays may only hold strings");
      }
      auto item = peek() == '"' ? read_basic_string() : read_literal_string();
      if (!item.ok()) {
        return Result<TomlValue>::failure(item.error());
      }
      items.push_back(item.take());
      skip_array_filler();
      if (consume(',')) {
        continue;
      }
      if (at_end()) {
        return Result<TomlValue>::failure("unterminated array starting at line " +
                                          std::to_string(started_at));
      }
      if (peek() != ']') {
        return fail<TomlValue>("expected ',' or ']' in array");
      }
    }
  }

  Result<TomlValue> read_scalar() {
    std::string token;
    while (!at_end() && peek() != '#' && peek() != '\n' && peek() != '\r') {
      token.push_back(advance());
    }
    while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) {
      token.pop_back();
    }
    if (token.empty()) {
      return fail<TomlValue>("missing value");
    }
    if (token == "true" || token == "false") {
      return Result<TomlValue>::success(TomlValue(std::in_place_type<bool>, token == "true"));
    }

    std::string digits;
    for (const char ch : token) {
      if (ch != '_') {
        digits.push_back(ch);
      }
    }
    const char *first = digits.data();
    const char *last = first + digits.size();
    if (*first == '+') {
      ++first;
    }
    std::int64_t integer = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, integer); ec == std::errc() && ptr == last) {
      return Result<TomlValue>::success(TomlValue{integer});
    }
    char *end = nullptr;
    const double real = std::strtod(digits.c_str(), &end);
    if (end == digits.c_str() + digits.size() &&
        digits.find_first_of(".eE") != std::string::npos) {
      return Result<TomlValue>::success(TomlValue{real});
    }
    return fail<TomlValue>("invalid value '" + token + "'");
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

template <typename T>
Result<T> wrong_type(const std::string &key, const char *expected, const TomlValue &found) {
  return Result<T>::failure(key + ": expected " + expected + ", found " + toml_type_name(found));
}

} // namespace

std::string toml_type_name(const TomlValue &value) {
  switch (value.index()) {
  case 0:
    return "string";
  case 1:
    return "boolean";
  case 2:
    return "integer";
  case 3:
    return "float";
  default:
    return "array";
  }
}

bool TomlDocument::has(const std::string &key) const { return values_.count(key) != 0; }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto &[key, value] : values_) {
    out.push_back(key);
  }
  return out;
}

Result<std::string> TomlDocument::string_or(const std::string &key,
                                            const std::string &fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::string>::success(fallback);
  }
  if (const auto *text = std::get_if<std::string>(&it->second)) {
    return Result<std::string>::success(*text);
  }
  return wrong_type<std::string>(key, "a string", it->second);
}

Result<bool> TomlDocument::bool_or(const std::string &key, const bool fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<bool>::success(fallback);
  }
  if (const auto *flag = std::get_if<bool>(&it->second)) {
    return Result<bool>::success(*flag);
  }
  return wrong_type<bool>(key, "true or false", it->second);
}

Result<std::uint64_t> TomlDocument::unsigned_or(const std::string &key,
                                                const std::uint64_t fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::uint64_t>::success(fallback);
  }
  const auto *integer = std::get_if<std::int64_t>(&it->second);
  if (integer == nullptr) {
    return wrong_type<std::uint64_t>(key, "an integer", it->second);
  }
  if (*integer < 0) {
    return Result<std::uint64_t>::failure(key + ": must not be negative");
  }
  return Result<std::uint64_t>::success(static_cast<std::uint64_t>(*integer));
}

Result<double> TomlDocument::double_or(const std::string &key, const double fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<double>::success(fallback);
  }
  if (const auto *real = std::get_if<double>(&it->second)) {
    return Result<double>::success(*real);
  }
  if (const auto *integer = std::get_if<std::int64_t>(&it->second)) {
    return Result<double>::success(static_cast<double>(*integer));
  }
  return wrong_type<double>(key, "a number", it->second);
}

Result<std::vector<std::string>>
TomlDocument::strings_or(const std::string &key, const std::vector<std::string> &fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::vector<std::string>>::success(fallback);
  }
  if (const auto *items = std::get_if<std::vector<std::string>>(&it->second)) {
    return Result<std::vector<std::string>>::success(*items);
  }
  return wrong_type<std::vector<std::string>>(key, "an array of strings", it->second);
}

Status TomlDocument::insert(std::string key, TomlValue value) {
  if (values_.count(key) != 0) {
    return Status::error("duplicate key '" + key + "'");
  }
  values_.emplace(std::move(key), std::move(value));
  return Status::success();
}

Result<TomlDocument> parse_toml(const std::string &content) { return TomlReader(content).read(); }

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(ch);
    }
  }
  out.push_back('"');
  return out;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    out += i == 0 ? "" : ", ";
    out += quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

} // namespace cmdgate::common
