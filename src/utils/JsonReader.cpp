/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace Tether {

namespace {
// Deeply nested input is rejected rather than recursing without bound
constexpr int MAX_DEPTH = 64;
} // anonymous namespace

// JsonValue implementation
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

std::optional<uint64_t> JsonValue::tryAsUnsigned() const {
  if (!isNumber())
    return std::nullopt;
  double num = asNumber();
  if (num < 0.0 || std::floor(num) != num || num >= 18446744073709551616.0)
    return std::nullopt;
  return static_cast<uint64_t>(num);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
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

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
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
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  auto value = parseValue(0);
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    fail("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    fail("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  switch (peek()) {
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
  case 'f':
  case 'n':
    return parseLiteral();
  case '\0':
    fail("Unexpected end of input");
    return std::nullopt;
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber();
    }
    fail(std::format("Unexpected character '{}'", peek()));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (consume('}')) {
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (!consume(':')) {
      fail("Expected ':' after object key");
      return std::nullopt;
    }

    skipWhitespace();
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    object[std::move(*key)] = std::move(*value);

    skipWhitespace();
    if (consume('}'))
      break;
    if (!consume(',')) {
      fail("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (consume(']')) {
    return JsonValue(std::move(array));
  }

  while (true) {
    skipWhitespace();
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    if (consume(']'))
      break;
    if (!consume(',')) {
      fail("Expected ',' or ']' in array");
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
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    if (atEnd())
      break;
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u':
      if (!appendUnicodeEscape(result))
        return std::nullopt;
      break;
    default:
      fail(std::format("Invalid escape sequence '\\{}'", escaped));
      return std::nullopt;
    }
  }

  fail("Unterminated string");
  return std::nullopt;
}

std::optional<uint32_t> JsonReader::readHex4() {
  uint32_t value = 0;
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
      fail("Invalid unicode escape");
      return std::nullopt;
    }
    advance();
    value = (value << 4) | digit;
  }
  return value;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  auto first = readHex4();
  if (!first)
    return false;

  uint32_t codepoint = *first;
  if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
    // High surrogate must be followed by \uDC00-\uDFFF
    if (!consume('\\') || !consume('u')) {
      fail("Unpaired surrogate in unicode escape");
      return false;
    }
    auto low = readHex4();
    if (!low)
      return false;
    if (*low < 0xDC00 || *low > 0xDFFF) {
      fail("Invalid low surrogate in unicode escape");
      return false;
    }
    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
  } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
    fail("Unpaired surrogate in unicode escape");
    return false;
  }

  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  size_t start = m_position;

  consume('-');
  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    fail("Invalid number");
    return std::nullopt;
  }

  if (consume('.')) {
    if (!(peek() >= '0' && peek() <= '9')) {
      fail("Expected digit after decimal point");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      fail("Expected digit in exponent");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  std::string text = m_input.substr(start, m_position - start);
  return JsonValue(std::strtod(text.c_str(), nullptr));
}

std::optional<JsonValue> JsonReader::parseLiteral() {
  auto matches = [this](const char *word) {
    return m_input.compare(m_position, std::char_traits<char>::length(word),
                           word) == 0;
  };

  if (matches("true")) {
    for (int i = 0; i < 4; ++i)
      advance();
    return JsonValue(true);
  }
  if (matches("false")) {
    for (int i = 0; i < 5; ++i)
      advance();
    return JsonValue(false);
  }
  if (matches("null")) {
    for (int i = 0; i < 4; ++i)
      advance();
    return JsonValue();
  }

  fail("Invalid literal");
  return std::nullopt;
}

void JsonReader::skipWhitespace() {
  while (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r') {
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

bool JsonReader::consume(char expected) {
  if (peek() != expected || atEnd())
    return false;
  advance();
  return true;
}

void JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError =
        std::format("{} at line {}, column {}", message, m_line, m_column);
  }
}

} // namespace Tether
