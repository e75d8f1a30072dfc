#include "core/json_dom.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace camctl::core::json {

namespace {

constexpr int kMaxDepth = 32;

class Reader {
public:
  explicit Reader(std::string_view input) : input_(input) {}

  bool Document(Value& root, std::string& error) {
    SkipSpace();
    if (!ReadValue(root, 0, error)) {
      return false;
    }
    SkipSpace();
    if (pos_ != input_.size()) {
      return Fail("trailing content after the document", error);
    }
    return true;
  }

private:
  bool ReadValue(Value& out, const int depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting deeper than " + std::to_string(kMaxDepth) + " levels", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input", error);
    }

    out = Value{};
    switch (input_[pos_]) {
    case '{':
      out.type = Value::Type::kObject;
      return ReadObject(out.object_value, depth, error);
    case '[':
      out.type = Value::Type::kArray;
      return ReadArray(out.array_value, depth, error);
    case '"':
      out.type = Value::Type::kString;
      return ReadString(out.string_value, error);
    case 't':
      out.type = Value::Type::kBool;
      out.bool_value = true;
      return ReadLiteral("true", error);
    case 'f':
      out.type = Value::Type::kBool;
      return ReadLiteral("false", error);
    case 'n':
      return ReadLiteral("null", error);
    default:
      out.type = Value::Type::kNumber;
      return ReadNumber(out.number_value, error);
    }
  }

  bool ReadObject(Value::Object& members, const int depth, std::string& error) {
    Step();
    SkipSpace();
    if (Accept('}')) {
      return true;
    }
    while (true) {
      SkipSpace();
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("expected a quoted member name", error);
      }
      std::string key;
      if (!ReadString(key, error)) {
        return false;
      }
      if (members.count(key) != 0U) {
        return Fail("duplicate member '" + key + "'", error);
      }
      SkipSpace();
      if (!Accept(':')) {
        return Fail("expected ':' after member name", error);
      }
      SkipSpace();
      if (!ReadValue(members[key], depth + 1, error)) {
        return false;
      }
      SkipSpace();
      if (Accept('}')) {
        return true;
      }
      if (!Accept(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ReadArray(Value::Array& items, const int depth, std::string& error) {
    Step();
    SkipSpace();
    if (Accept(']')) {
      return true;
    }
    while (true) {
      SkipSpace();
      items.emplace_back();
      if (!ReadValue(items.back(), depth + 1, error)) {
        return false;
      }
      SkipSpace();
      if (Accept(']')) {
        return true;
      }
      if (!Accept(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
    Step();
    while (pos_ < input_.size()) {
      const char c = Step();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character in string", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= input_.size()) {
        break;
      }
      const char esc = Step();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ReadUnicodeEscape(out, error)) {
          return false;
        }
        break;
      default:
        return Fail(std::string("invalid escape '\\") + esc + "'", error);
      }
    }
    return Fail("unterminated string", error);
  }

  // Basic multilingual plane only; surrogate halves are rejected.
  bool ReadUnicodeEscape(std::string& out, std::string& error) {
    if (input_.size() - pos_ < 4U) {
      return Fail("truncated \\u escape", error);
    }
    unsigned code = 0U;
    for (int i = 0; i < 4; ++i) {
      const char h = Step();
      code <<= 4U;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        return Fail("non-hex digit in \\u escape", error);
      }
    }
    if (code >= 0xD800U && code <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }
    if (code < 0x80U) {
      out.push_back(static_cast<char>(code));
    } else if (code < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    }
    return true;
  }

  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    Accept('-');
    if (!Accept('0') && Digits() == 0U) {
      return Fail("expected a value", error);
    }
    if (Accept('.') && Digits() == 0U) {
      return Fail("expected digits after '.'", error);
    }
    if (Accept('e') || Accept('E')) {
      if (!Accept('+')) {
        Accept('-');
      }
      if (Digits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string token(input_.substr(start, pos_ - start));
    char* end = nullptr;
    errno = 0;
    out = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || errno == ERANGE) {
      return Fail("number '" + token + "' is out of range", error);
    }
    return true;
  }

  bool ReadLiteral(std::string_view literal, std::string& error) {
    if (input_.substr(pos_, literal.size()) != literal) {
      return Fail("expected a value", error);
    }
    for (std::size_t i = 0; i < literal.size(); ++i) {
      Step();
    }
    return true;
  }

  std::size_t Digits() {
    std::size_t count = 0U;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Step();
      ++count;
    }
    return count;
  }

  void SkipSpace() {
    while (pos_ < input_.size() &&
           (input_[pos_] == ' ' || input_[pos_] == '\t' || input_[pos_] == '\n' ||
            input_[pos_] == '\r')) {
      Step();
    }
  }

  bool Accept(const char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      Step();
      return true;
    }
    return false;
  }

  char Step() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1U;
    } else {
      ++col_;
    }
    return c;
  }

  bool Fail(const std::string& what, std::string& error) const {
    error = "line " + std::to_string(line_) + ", col " + std::to_string(col_) + ": " + what;
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0U;
  std::size_t line_ = 1U;
  std::size_t col_ = 1U;
};

} // namespace

const char* TypeName(const Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "unknown";
}

bool Parse(std::string_view input, Value& root, std::string& error) {
  error.clear();
  root = Value{};
  Reader reader(input);
  return reader.Document(root, error);
}

const Value* FindMember(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  return it == object.object_value.end() ? nullptr : &it->second;
}

bool TryGetInt64(const Value& value, std::int64_t& out) {
  if (value.type != Value::Type::kNumber || !std::isfinite(value.number_value) ||
      std::trunc(value.number_value) != value.number_value) {
    return false;
  }
  // 2^63 is exactly representable; anything at or above it overflows.
  constexpr double kLimit = 9223372036854775808.0;
  if (value.number_value < -kLimit || value.number_value >= kLimit) {
    return false;
  }
  out = static_cast<std::int64_t>(value.number_value);
  return true;
}

std::string Quote(std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(text.size() + 2U);
  out.push_back('"');
  for (const char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto byte = static_cast<unsigned char>(c);
      if (byte < 0x20U) {
        out += "\\u00";
        out.push_back(kHex[byte >> 4U]);
        out.push_back(kHex[byte & 0x0FU]);
      } else {
        out.push_back(c);
      }
      break;
    }
    }
  }
  out.push_back('"');
  return out;
}

} // namespace camctl::core::json
