/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace Warband {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }
} // namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  if (std::holds_alternative<bool>(m_value))
    return JsonType::Boolean;
  if (std::holds_alternative<double>(m_value))
    return JsonType::Number;
  if (std::holds_alternative<std::string>(m_value))
    return JsonType::String;
  if (std::holds_alternative<JsonArray>(m_value))
    return JsonType::Array;
  if (std::holds_alternative<JsonObject>(m_value))
    return JsonType::Object;
  return JsonType::Null;
}

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

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  return asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size())
    return nullValue();
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    m_lastError = "Empty JSON input";
    return false;
  }

  auto value = parseValue(0);
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected content after JSON value");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(size_t depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
    if (parseLiteral("true"))
      return JsonValue(true);
    return std::nullopt;
  case 'f':
    if (parseLiteral("false"))
      return JsonValue(false);
    return std::nullopt;
  case 'n':
    if (parseLiteral("null"))
      return JsonValue();
    return std::nullopt;
  default:
    if (c == '-' || isDigit(c))
      return parseNumber();
    if (atEnd()) {
      setError("Unexpected end of input");
    } else {
      setError(std::format("Unexpected character '{}'", c));
    }
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(size_t depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (peek() != ':') {
      setError(std::format("Expected ':' after key \"{}\"", *key));
      return std::nullopt;
    }
    advance();

    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    object.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray(size_t depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(array));
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (!atEnd()) {
    char c = advance();
    if (c == '"')
      return result;

    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }

    if (c != '\\') {
      result.push_back(c);
      continue;
    }

    if (atEnd())
      break;
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result.push_back(escaped);
      break;
    case 'b':
      result.push_back('\b');
      break;
    case 'f':
      result.push_back('\f');
      break;
    case 'n':
      result.push_back('\n');
      break;
    case 'r':
      result.push_back('\r');
      break;
    case 't':
      result.push_back('\t');
      break;
    case 'u':
      if (!appendCodePoint(result))
        return std::nullopt;
      break;
    default:
      setError(std::format("Invalid escape sequence '\\{}'", escaped));
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return std::nullopt;
    }
  }
  return value;
}

bool JsonReader::appendCodePoint(std::string &out) {
  auto first = parseHex4();
  if (!first)
    return false;

  uint32_t codePoint = *first;
  if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
    // High surrogate must be followed by \uDC00-\uDFFF
    if (advance() != '\\' || advance() != 'u') {
      setError("Unpaired UTF-16 surrogate");
      return false;
    }
    auto second = parseHex4();
    if (!second)
      return false;
    if (*second < 0xDC00 || *second > 0xDFFF) {
      setError("Invalid UTF-16 low surrogate");
      return false;
    }
    codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (*second - 0xDC00);
  }

  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number format");
    return std::nullopt;
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    setError("Number out of range: " + text);
    return std::nullopt;
  }
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *literal) {
  const size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    setError(std::format("Invalid literal, expected '{}'", literal));
    return false;
  }
  for (size_t i = 0; i < length; ++i)
    advance();
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::setError(const std::string &message) {
  // Keep the first (innermost) error
  if (m_lastError.empty()) {
    m_lastError =
        std::format("{} at line {}, column {}", message, m_line, m_column);
  }
}

} // namespace Warband
