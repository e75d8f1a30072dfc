#include "core/json_dom.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

using camctl::core::json::FindMember;
using camctl::core::json::Parse;
using camctl::core::json::TryGetInt64;
using camctl::core::json::Value;

TEST_CASE("config-shaped documents parse into a DOM", "[json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"device": "/dev/video0", "controls": {"gain": 64, "brightness": -5},
                    "resolution": null, "capture_fps": 12.5, "flags": [true, false]})",
                root, error));
  REQUIRE(root.type == Value::Type::kObject);

  const Value* device = FindMember(root, "device");
  REQUIRE(device != nullptr);
  CHECK(device->string_value == "/dev/video0");

  const Value* controls = FindMember(root, "controls");
  REQUIRE(controls != nullptr);
  std::int64_t brightness = 0;
  REQUIRE(TryGetInt64(*FindMember(*controls, "brightness"), brightness));
  CHECK(brightness == -5);

  CHECK(FindMember(root, "resolution")->type == Value::Type::kNull);
  CHECK(FindMember(root, "capture_fps")->number_value == 12.5);
  CHECK(FindMember(root, "flags")->array_value.size() == 2U);
  CHECK(FindMember(root, "missing") == nullptr);
  CHECK(FindMember(*device, "anything") == nullptr);
}

TEST_CASE("unicode escapes decode to UTF-8", "[json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"("caf\u00e9 \u20AC")", root, error));
  CHECK(root.string_value == "caf\xC3\xA9 \xE2\x82\xAC");
  CHECK_FALSE(Parse(R"("\ud83d")", root, error));
}

TEST_CASE("malformed documents report their position", "[json]") {
  Value root;
  std::string error;

  CHECK_FALSE(Parse("{\n  \"gain\": 1,\n  \"gain\": 2\n}", root, error));
  CHECK(error.find("duplicate member 'gain'") != std::string::npos);
  CHECK(error.find("line 3") != std::string::npos);

  CHECK_FALSE(Parse(R"({"a": 1,})", root, error));
  CHECK(error.find("member name") != std::string::npos);

  CHECK_FALSE(Parse(R"({"a": 1} x)", root, error));
  CHECK(error.find("trailing") != std::string::npos);

  CHECK_FALSE(Parse(R"({"a": tru})", root, error));
  CHECK_FALSE(Parse(R"({"a": -})", root, error));
  CHECK_FALSE(Parse(R"({"a": 1.})", root, error));
  CHECK_FALSE(Parse("\"open", root, error));
  CHECK_FALSE(Parse("", root, error));

  std::string deep(40U, '[');
  deep += std::string(40U, ']');
  CHECK_FALSE(Parse(deep, root, error));
  CHECK(error.find("nesting") != std::string::npos);
}

TEST_CASE("integral views reject fractions and overflow", "[json]") {
  Value number;
  number.type = Value::Type::kNumber;
  std::int64_t out = 0;

  number.number_value = 42.0;
  CHECK(TryGetInt64(number, out));
  CHECK(out == 42);

  number.number_value = 0.5;
  CHECK_FALSE(TryGetInt64(number, out));

  number.number_value = 1e19;
  CHECK_FALSE(TryGetInt64(number, out));

  Value text;
  text.type = Value::Type::kString;
  CHECK_FALSE(TryGetInt64(text, out));
}
