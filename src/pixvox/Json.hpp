#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pixvox {

// JSON document model used for option files and conversion reports.
//
// Input is strict: no comments, no trailing commas and no repeated key inside one object
// (an option given twice would be ambiguous). Numbers are doubles. Object members keep the
// order they had in the file.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

// "null", "boolean", "number", "string", "array", "object".
const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

// Errors read "line L, column C: <reason>" with 1-based positions (columns count bytes).
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape a string for use inside a JSON string literal (without the surrounding quotes).
std::string JsonEscape(const std::string& s);

} // namespace pixvox
