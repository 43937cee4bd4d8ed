// Tests for core/json_parser.h -- flat config object parsing.

#include "core/json_parser.h"

#include <gtest/gtest.h>

namespace lanefall {
namespace {

TEST(JsonParserTest, ParsesScalarTypes) {
  JsonObject obj;
  std::string error;
  ASSERT_TRUE(parseJsonObject(
      R"({"seed": 42, "hard_mode": true, "chart": "songs/demo.csv", "offset": -1.5, "x": null})",
      obj, error))
      << error;

  EXPECT_EQ(obj["seed"].type, JsonValue::Number);
  EXPECT_EQ(obj["seed"].asInt(), 42);
  EXPECT_EQ(obj["seed"].asUint(), 42u);
  EXPECT_TRUE(obj["hard_mode"].asBool());
  EXPECT_EQ(obj["chart"].asString(), "songs/demo.csv");
  EXPECT_DOUBLE_EQ(obj["offset"].asDouble(), -1.5);
  EXPECT_EQ(obj["x"].type, JsonValue::Null);
}

TEST(JsonParserTest, AccessorsFallBackOnTypeMismatch) {
  JsonObject obj;
  std::string error;
  ASSERT_TRUE(parseJsonObject(R"({"name": "x", "count": -4})", obj, error));
  EXPECT_EQ(obj["name"].asInt(7), 7);
  EXPECT_FALSE(obj["name"].asBool(false));
  EXPECT_EQ(obj["count"].asString("none"), "none");
  EXPECT_EQ(obj["count"].asUint(9), 9u);
}

TEST(JsonParserTest, OutOfRangeNumbersFallBack) {
  JsonObject obj;
  std::string error;
  ASSERT_TRUE(parseJsonObject(R"({"seed": 1e20, "max": 4294967295, "big": -3e9})", obj, error));
  EXPECT_EQ(obj["seed"].asUint(11), 11u);
  EXPECT_EQ(obj["seed"].asInt(5), 5);
  EXPECT_EQ(obj["max"].asUint(), 4294967295u);
  EXPECT_EQ(obj["big"].asInt(-1), -1);
}

TEST(JsonParserTest, UnescapesStrings) {
  JsonObject obj;
  std::string error;
  ASSERT_TRUE(parseJsonObject(R"({"path": "a\"b\\c\nd"})", obj, error));
  EXPECT_EQ(obj["path"].asString(), "a\"b\\c\nd");
}

TEST(JsonParserTest, SkipsNestedContainers) {
  JsonObject obj;
  std::string error;
  ASSERT_TRUE(parseJsonObject(R"({"lanes": [1, {"a": "]"}], "seed": 5})", obj, error)) << error;
  EXPECT_EQ(obj.count("lanes"), 0u);
  EXPECT_EQ(obj["seed"].asInt(), 5);
}

TEST(JsonParserTest, EmptyObject) {
  JsonObject obj;
  std::string error;
  EXPECT_TRUE(parseJsonObject("  { }  ", obj, error));
  EXPECT_TRUE(obj.empty());
}

TEST(JsonParserTest, RejectsMalformedInput) {
  JsonObject obj;
  std::string error;
  EXPECT_FALSE(parseJsonObject("[1, 2]", obj, error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(parseJsonObject(R"({"seed": 1)", obj, error));
  EXPECT_FALSE(parseJsonObject(R"({"seed" 1})", obj, error));
  EXPECT_FALSE(parseJsonObject(R"({"seed": 1 "x": 2})", obj, error));
  EXPECT_FALSE(parseJsonObject(R"({"seed": nope})", obj, error));
}

}  // namespace
}  // namespace lanefall
