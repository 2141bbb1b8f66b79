/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace Driftwood {

namespace {

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << "\\u" << std::hex << std::setw(4) << std::setfill('0')
               << static_cast<int>(c) << std::dec << std::setfill(' ');
      } else {
        stream << c;
      }
      break;
    }
  }
  stream << '"';
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // anonymous namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

int JsonValue::asInt() const {
  const double value = std::get<double>(m_value);
  if (std::isnan(value))
    return 0;
  if (value <= static_cast<double>(std::numeric_limits<int>::min()))
    return std::numeric_limits<int>::min();
  if (value >= static_cast<double>(std::numeric_limits<int>::max()))
    return std::numeric_limits<int>::max();
  return static_cast<int>(value);
}

std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber())
    return std::nullopt;
  const double value = asNumber();
  if (!std::isfinite(value) ||
      value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value > static_cast<double>(std::numeric_limits<int>::max()))
    return std::nullopt;
  return asInt();
}

std::optional<float> JsonValue::tryAsFloat() const {
  if (isNumber())
    return asFloat();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  return (*this)[key].tryAsInt().value_or(fallback);
}

float JsonValue::getFloat(const std::string &key, float fallback) const {
  return (*this)[key].tryAsFloat().value_or(fallback);
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return null_value;
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  const JsonArray *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size())
    return null_value;
  return (*arr)[index];
}

JsonValue &JsonValue::operator[](size_t index) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  auto &arr = asArray();
  if (index >= arr.size()) {
    arr.resize(index + 1);
  }
  return arr[index];
}

void JsonValue::push(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  write(oss, 0, 0);
  return oss.str();
}

std::string JsonValue::toStyledString(int indent) const {
  std::ostringstream oss;
  write(oss, std::max(indent, 0), 0);
  oss << '\n';
  return oss.str();
}

void JsonValue::write(std::ostream &stream, int indent, int depth) const {
  const bool pretty = indent > 0;
  auto newline = [&](int level) {
    if (pretty) {
      stream << '\n' << std::string(static_cast<size_t>(level * indent), ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (!std::isfinite(num)) {
      stream << "null"; // JSON has no representation for inf/nan
    } else if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << std::setprecision(9) << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    stream << '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ',';
      newline(depth + 1);
      arr[i].write(stream, indent, depth + 1);
    }
    if (!arr.empty())
      newline(depth);
    stream << ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    std::vector<const std::string *> keys;
    keys.reserve(obj.size());
    for (const auto &[key, value] : obj) {
      keys.push_back(&key);
    }
    std::sort(keys.begin(), keys.end(),
              [](const std::string *a, const std::string *b) { return *a < *b; });

    stream << '{';
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0)
        stream << ',';
      newline(depth + 1);
      writeEscaped(stream, *keys[i]);
      stream << (pretty ? ": " : ":");
      obj.at(*keys[i]).write(stream, indent, depth + 1);
    }
    if (!keys.empty())
      newline(depth);
    stream << '}';
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    setError("Empty JSON input");
    return false;
  }

  JsonValue root = parseValue(0);
  if (!m_lastError.empty()) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected token after JSON value");
    return false;
  }

  m_root = std::move(root);
  return true;
}

JsonValue JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    setError("Nesting too deep");
    return JsonValue();
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth);
  case '[':
    return parseArray(depth);
  case '"': {
    std::string text;
    if (!parseString(text))
      return JsonValue();
    return JsonValue(std::move(text));
  }
  case 't':
    return parseLiteral("true") ? JsonValue(true) : JsonValue();
  case 'f':
    return parseLiteral("false") ? JsonValue(false) : JsonValue();
  case 'n':
    parseLiteral("null");
    return JsonValue();
  default:
    break;
  }

  if (c == '-' || (c >= '0' && c <= '9')) {
    double number = 0.0;
    if (!parseNumber(number))
      return JsonValue();
    return JsonValue(number);
  }

  if (atEnd()) {
    setError("Unexpected end of input");
  } else {
    setError(std::string("Unexpected character: ") + c);
  }
  return JsonValue();
}

JsonValue JsonReader::parseObject(int depth) {
  JsonObject result;
  advance(); // '{'

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(result));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return JsonValue();
    }
    std::string key;
    if (!parseString(key))
      return JsonValue();

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return JsonValue();
    }
    advance();

    JsonValue value = parseValue(depth + 1);
    if (!m_lastError.empty())
      return JsonValue();
    result[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected '}' or ',' in object");
      return JsonValue();
    }
  }
  return JsonValue(std::move(result));
}

JsonValue JsonReader::parseArray(int depth) {
  JsonArray result;
  advance(); // '['

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(result));
  }

  while (true) {
    JsonValue value = parseValue(depth + 1);
    if (!m_lastError.empty())
      return JsonValue();
    result.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ']' or ',' in array");
      return JsonValue();
    }
  }
  return JsonValue(std::move(result));
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return false;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd())
      break;
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseHexQuad(codepoint))
        return false;
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\') {
        advance();
        uint32_t low = 0;
        if (advance() != 'u' || !parseHexQuad(low) || low < 0xDC00 ||
            low > 0xDFFF) {
          setError("Invalid Unicode surrogate pair");
          return false;
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      setError(std::string("Invalid escape sequence: \\") + escaped);
      return false;
    }
  }

  setError("Unterminated string");
  return false;
}

bool JsonReader::parseNumber(double &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    setError("Invalid number format");
    return false;
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Invalid number format: expected digit after decimal point");
      return false;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Invalid number format: expected digit in exponent");
      return false;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  std::string text = m_input.substr(start, m_position - start);
  char *end = nullptr;
  out = std::strtod(text.c_str(), &end);
  if (end == text.c_str()) {
    setError("Invalid number format: " + text);
    return false;
  }
  return true;
}

bool JsonReader::parseLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      setError(std::string("Invalid token, expected ") + literal);
      return false;
    }
    advance();
  }
  return true;
}

bool JsonReader::parseHexQuad(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return false;
    }
    advance();
    out = (out << 4) | digit;
  }
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::setError(const std::string &message) {
  if (!m_lastError.empty())
    return; // keep the first error
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
}

} // namespace Driftwood
