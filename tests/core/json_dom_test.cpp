#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <limits>
#include <string>

using cellwatch::core::json::FindPath;
using cellwatch::core::json::Parse;
using cellwatch::core::json::Value;

TEST_CASE("JSON DOM parses nested objects", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"a": {"b": [1, 2.5, true, null, "x"]}, "c": -3e2})", root, error));

  const Value* array = FindPath(root, {"a", "b"});
  REQUIRE(array != nullptr);
  REQUIRE(array->type == Value::Type::kArray);
  REQUIRE(array->array_value.size() == 5U);
  REQUIRE(array->array_value[1].number_value == 2.5);
  REQUIRE(array->array_value[2].bool_value);
  REQUIRE(array->array_value[4].string_value == "x");

  const Value* c = FindPath(root, {"c"});
  REQUIRE(c != nullptr);
  REQUIRE(c->number_value == -300.0);
  REQUIRE(FindPath(root, {"a", "missing"}) == nullptr);
  REQUIRE(FindPath(root, {"c", "deeper"}) == nullptr);
}

TEST_CASE("JSON DOM reports syntax errors", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse("{\"a\": 1,}", root, error));
  REQUIRE_FALSE(error.empty());
  REQUIRE_FALSE(Parse("{\"a\": 1} trailing", root, error));
  REQUIRE_FALSE(Parse(R"({"a": 1, "a": 2})", root, error));
  REQUIRE(error.find("duplicate") != std::string::npos);
}

TEST_CASE("JSON helpers escape strings and guard non-finite numbers", "[core][json]") {
  REQUIRE(cellwatch::core::EscapeJson("a\"b\\c\n") == "a\\\"b\\\\c\\n");
  REQUIRE(cellwatch::core::EscapeJson(std::string(1, '\x01')) == "\\u0001");
  REQUIRE(cellwatch::core::FormatJsonNumber(1.5, 2) == "1.50");
  REQUIRE(cellwatch::core::FormatJsonNumber(std::numeric_limits<double>::infinity()) == "null");
}

TEST_CASE("JSON DOM accepts only whole positive counts", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"ok": 24, "zero": 0, "frac": 2.5, "neg": -1, "text": "3", "big": 1e12})",
                root, error));

  std::size_t count = 0;
  REQUIRE(cellwatch::core::json::AsPositiveCount(*FindPath(root, {"ok"}), count));
  REQUIRE(count == 24U);
  for (const char* key : {"zero", "frac", "neg", "text", "big"}) {
    INFO(key);
    REQUIRE_FALSE(cellwatch::core::json::AsPositiveCount(*FindPath(root, {key}), count));
  }
}
