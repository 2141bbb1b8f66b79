/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Driftwood {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

/**
 * @brief Tagged JSON DOM node used for data tables, settings and raft saves
 *
 * Objects are unordered in memory; the writer emits keys sorted so that saved
 * documents are byte-stable between runs.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(float value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(const JsonArray &value) : m_value(value) {}
  explicit JsonValue(JsonArray &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const JsonObject &value) : m_value(value) {}
  explicit JsonValue(JsonObject &&value) : m_value(std::move(value)) {}

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
  bool isNull() const { return getType() == JsonType::Null; }
  bool isBool() const { return getType() == JsonType::Boolean; }
  bool isNumber() const { return getType() == JsonType::Number; }
  bool isString() const { return getType() == JsonType::String; }
  bool isArray() const { return getType() == JsonType::Array; }
  bool isObject() const { return getType() == JsonType::Object; }

  // Throw std::bad_variant_access on type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  // Saturates at the int range; NaN reads as 0
  int asInt() const;
  float asFloat() const { return static_cast<float>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  // Non-throwing accessors
  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // nullopt unless the number is finite and fits in an int
  std::optional<int> tryAsInt() const;
  std::optional<float> tryAsFloat() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Typed member lookup with a fallback for missing or mistyped keys
  int getInt(const std::string &key, int fallback) const;
  float getFloat(const std::string &key, float fallback) const;
  bool getBool(const std::string &key, bool fallback) const;
  std::string getString(const std::string &key,
                        const std::string &fallback) const;

  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  JsonValue &operator[](const std::string &key);

  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](size_t index);
  void push(JsonValue value);
  size_t size() const;

  // Compact single-line form
  std::string toString() const;
  // Indented form for files meant to be read by people
  std::string toStyledString(int indent = 2) const;

private:
  void write(std::ostream &stream, int indent, int depth) const;

  ValueType m_value;
};

/**
 * @brief Recursive-descent JSON parser with line/column error reporting
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  static constexpr int MAX_DEPTH = 256;

  JsonValue parseValue(int depth);
  JsonValue parseObject(int depth);
  JsonValue parseArray(int depth);
  bool parseString(std::string &out);
  bool parseNumber(double &out);
  bool parseLiteral(const char *literal);
  bool parseHexQuad(uint32_t &out);
  void skipWhitespace();
  char peek() const;
  char advance();
  bool atEnd() const { return m_position >= m_input.size(); }
  void setError(const std::string &message);

  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;
};

} // namespace Driftwood

#endif // JSONREADER_HPP
