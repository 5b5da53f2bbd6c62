#include "pixvox/Json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace pixvox {

namespace {

constexpr int kMaxNesting = 64;

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp < 0x80u) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
  } else if (cp < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
  }
  out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
}

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

class JsonReader {
public:
  explicit JsonReader(const std::string& text) : m_text(text) {}

  bool readDocument(JsonValue& out)
  {
    if (!readValue(out, 0)) return false;
    skipSpace();
    if (!atEnd()) return error("unexpected data after the top-level value");
    return true;
  }

  const std::string& errorMessage() const { return m_error; }

private:
  bool atEnd() const { return m_pos >= m_text.size(); }
  char cur() const { return atEnd() ? '\0' : m_text[m_pos]; }

  void skipSpace()
  {
    while (!atEnd()) {
      const char c = m_text[m_pos];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_pos;
    }
  }

  bool error(const std::string& reason)
  {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(m_pos, m_text.size());
    for (std::size_t k = 0; k < end; ++k) {
      if (m_text[k] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    m_error = "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + reason;
    return false;
  }

  bool readValue(JsonValue& out, int depth)
  {
    skipSpace();
    if (atEnd()) return error("unexpected end of input");

    out = JsonValue{};
    const char c = cur();
    switch (c) {
    case '{': return readObject(out, depth + 1);
    case '[': return readArray(out, depth + 1);
    case '"':
      out.type = JsonValue::Type::String;
      return readString(out.stringValue);
    case 't':
      out.type = JsonValue::Type::Bool;
      out.boolValue = true;
      return readKeyword("true");
    case 'f':
      out.type = JsonValue::Type::Bool;
      return readKeyword("false");
    case 'n': return readKeyword("null");
    default: break;
    }

    if (c == '-' || IsDigit(c)) {
      out.type = JsonValue::Type::Number;
      return readNumber(out.numberValue);
    }
    return error(std::string("unexpected character '") + c + "'");
  }

  bool readKeyword(const char* word)
  {
    const std::size_t n = std::strlen(word);
    if (m_text.compare(m_pos, n, word) != 0) return error(std::string("invalid literal, expected '") + word + "'");
    m_pos += n;
    return true;
  }

  bool skipDigits()
  {
    if (!IsDigit(cur())) return false;
    while (IsDigit(cur())) ++m_pos;
    return true;
  }

  // int [frac] [exp]; a leading zero is never followed by more digits.
  bool readNumber(double& out)
  {
    const std::size_t start = m_pos;
    if (cur() == '-') ++m_pos;
    if (cur() == '0') {
      ++m_pos;
    } else if (!skipDigits()) {
      return error("expected a digit");
    }
    if (cur() == '.') {
      ++m_pos;
      if (!skipDigits()) return error("expected a digit after the decimal point");
    }
    if (cur() == 'e' || cur() == 'E') {
      ++m_pos;
      if (cur() == '+' || cur() == '-') ++m_pos;
      if (!skipDigits()) return error("expected exponent digits");
    }

    const std::string literal = m_text.substr(start, m_pos - start);
    const double v = std::strtod(literal.c_str(), nullptr);
    if (std::isinf(v)) {
      m_pos = start;
      return error("number out of range: " + literal);
    }
    out = v;
    return true;
  }

  bool readHex4(std::uint32_t& out)
  {
    out = 0;
    for (int k = 0; k < 4; ++k, ++m_pos) {
      const char h = cur();
      std::uint32_t nibble = 0;
      if (IsDigit(h)) {
        nibble = static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        nibble = static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        nibble = static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return error("expected 4 hex digits after \\u");
      }
      out = (out << 4) | nibble;
    }
    return true;
  }

  // Called just past "\u". Joins UTF-16 surrogate pairs.
  bool readUnicodeEscape(std::string& out)
  {
    std::uint32_t cp = 0;
    if (!readHex4(cp)) return false;

    if (cp >= 0xDC00u && cp <= 0xDFFFu) return error("low surrogate without a preceding high surrogate");
    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      if (m_text.compare(m_pos, 2, "\\u") != 0) return error("high surrogate must be followed by \\u");
      m_pos += 2;
      std::uint32_t low = 0;
      if (!readHex4(low)) return false;
      if (low < 0xDC00u || low > 0xDFFFu) return error("invalid low surrogate");
      cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
    }
    AppendUtf8(out, cp);
    return true;
  }

  bool readString(std::string& out)
  {
    ++m_pos; // opening quote
    out.clear();

    static const char kEscapes[] = "\"\\/bfnrt";
    static const char kDecoded[] = "\"\\/\b\f\n\r\t";

    for (;;) {
      if (atEnd()) return error("unterminated string");
      const char c = m_text[m_pos];
      if (c == '"') {
        ++m_pos;
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20u) return error("raw control character in string");
      ++m_pos;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (atEnd()) return error("unterminated string");
      const char e = m_text[m_pos++];
      if (e == 'u') {
        if (!readUnicodeEscape(out)) return false;
        continue;
      }
      const char* hit = std::strchr(kEscapes, e);
      if (e == '\0' || hit == nullptr) {
        --m_pos;
        return error(std::string("invalid escape '\\") + e + "'");
      }
      out.push_back(kDecoded[hit - kEscapes]);
    }
  }

  bool enter(int depth)
  {
    if (depth <= kMaxNesting) return true;
    return error("nesting deeper than " + std::to_string(kMaxNesting) + " levels");
  }

  bool readArray(JsonValue& out, int depth)
  {
    if (!enter(depth)) return false;
    ++m_pos;
    out.type = JsonValue::Type::Array;

    skipSpace();
    if (cur() == ']') {
      ++m_pos;
      return true;
    }

    for (;;) {
      out.arrayValue.emplace_back();
      if (!readValue(out.arrayValue.back(), depth)) return false;

      skipSpace();
      if (cur() == ',') {
        ++m_pos;
      } else if (cur() == ']') {
        ++m_pos;
        return true;
      } else {
        return error("expected ',' or ']' in array");
      }
    }
  }

  bool readObject(JsonValue& out, int depth)
  {
    if (!enter(depth)) return false;
    ++m_pos;
    out.type = JsonValue::Type::Object;

    skipSpace();
    if (cur() == '}') {
      ++m_pos;
      return true;
    }

    for (;;) {
      skipSpace();
      if (cur() != '"') return error("expected a string key");
      std::string key;
      if (!readString(key)) return false;
      if (FindJsonMember(out, key) != nullptr) return error("duplicate key '" + key + "'");

      skipSpace();
      if (cur() != ':') return error("expected ':' after key '" + key + "'");
      ++m_pos;

      JsonValue value;
      if (!readValue(value, depth)) return false;
      out.objectValue.emplace_back(std::move(key), std::move(value));

      skipSpace();
      if (cur() == ',') {
        ++m_pos;
      } else if (cur() == '}') {
        ++m_pos;
        return true;
      } else {
        return error("expected ',' or '}' in object");
      }
    }
  }

  const std::string& m_text;
  std::size_t m_pos = 0;
  std::string m_error;
};

} // namespace

const char* JsonTypeName(JsonValue::Type t)
{
  switch (t) {
  case JsonValue::Type::Null: return "null";
  case JsonValue::Type::Bool: return "boolean";
  case JsonValue::Type::Number: return "number";
  case JsonValue::Type::String: return "string";
  case JsonValue::Type::Array: return "array";
  case JsonValue::Type::Object: return "object";
  default: return "unknown";
  }
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  const auto it = std::find_if(obj.objectValue.begin(), obj.objectValue.end(),
                               [&](const std::pair<std::string, JsonValue>& kv) { return kv.first == key; });
  return it == obj.objectValue.end() ? nullptr : &it->second;
}

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  JsonReader reader(text);
  JsonValue v;
  if (!reader.readDocument(v)) {
    outError = reader.errorMessage();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

std::string JsonEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20u) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buf;
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  return out;
}

} // namespace pixvox
