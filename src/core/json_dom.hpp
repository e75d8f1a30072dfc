#ifndef CAMCTL_CORE_JSON_DOM_HPP_
#define CAMCTL_CORE_JSON_DOM_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace camctl::core::json {

// Small DOM for the service config file. Objects keep keys sorted, which
// also gives the config writer its stable key order on round trips.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

const char* TypeName(Value::Type type);

// Strict RFC 8259 parse of one document. Duplicate object keys are rejected
// (a config naming "gain" twice is a mistake, not a merge). Errors read
// "line L, col C: <what>".
bool Parse(std::string_view input, Value& root, std::string& error);

// Member of `object`, or nullptr when `object` is not an object or lacks `key`.
const Value* FindMember(const Value& object, std::string_view key);

// Integral view of a number node. Fractional or out-of-range numbers are
// rejected rather than truncated.
bool TryGetInt64(const Value& value, std::int64_t& out);

// `text` as a JSON string literal, quotes included. Used by the writers that
// emit JSON directly rather than through the DOM.
std::string Quote(std::string_view text);

} // namespace camctl::core::json

#endif // CAMCTL_CORE_JSON_DOM_HPP_
