#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "value.hpp"

using namespace telemetry;
using telemetry::test::parseObject;
using telemetry::test::parseValue;

TEST(ValueTest, SplitFieldPathSkipsEmptySegments) {
  const std::vector<std::string> expected = {"device", "uid"};
  EXPECT_EQ(splitFieldPath("device.uid"), expected);
  EXPECT_EQ(splitFieldPath(".device..uid."), expected);
  EXPECT_TRUE(splitFieldPath("").empty());
}

TEST(ValueTest, FindPathDescendsNestedObjects) {
  const Object event = parseObject(R"({"device":{"uid":"host-1","ip":"10.0.0.1"},"name":"x"})");

  const Value* uid = findPath(event, "device.uid");
  ASSERT_NE(uid, nullptr);
  EXPECT_EQ(uid->string_value(), "host-1");

  EXPECT_EQ(findPath(event, "device.missing"), nullptr);
  EXPECT_EQ(findPath(event, "name.inner"), nullptr);
  EXPECT_EQ(findPath(event, ""), nullptr);
}

TEST(ValueTest, TypedAccessDistinguishesMissingFromMismatch) {
  const Object event = parseObject(R"({"asset_id":42,"user_id":"alice","tags":["a"],"device":{}})");

  const FieldResult<std::string> asset = stringAt(event, "asset_id");
  EXPECT_TRUE(asset.isMismatch());
  EXPECT_EQ(asset.error(), FieldError::kTypeMismatch);

  const FieldResult<std::string> missing = stringAt(event, "host_id");
  EXPECT_TRUE(missing.isMissing());

  const FieldResult<std::string> user = stringAt(event, "user_id");
  ASSERT_TRUE(user.ok());
  EXPECT_EQ(user.value(), "alice");

  EXPECT_TRUE(listAt(event, "tags").ok());
  EXPECT_TRUE(listAt(event, "device").isMismatch());
  EXPECT_TRUE(objectAt(event, "device").ok());
  EXPECT_TRUE(numberAt(event, "user_id").isMismatch());
  EXPECT_TRUE(valueAt(event, "tags").ok());
}

TEST(ValueTest, IntegerAccessRequiresIntegralNumbers) {
  const Object event = parseObject(R"({"a":7,"b":7.5,"c":"7","d":2004.0})");

  ASSERT_TRUE(integerAt(event, "a").ok());
  EXPECT_EQ(integerAt(event, "a").value(), 7);
  EXPECT_TRUE(integerAt(event, "b").isMismatch());
  EXPECT_TRUE(integerAt(event, "c").isMismatch());
  EXPECT_EQ(integerAt(event, "d").value(), 2004);
}

TEST(ValueTest, IntegerAccessStaysInsideInt64Range) {
  // 9223372036854775807 parses to 2^63, one past the largest int64.
  const Object event = parseObject(R"({"big":9223372036854775807,"min":-9223372036854775808})");

  EXPECT_TRUE(integerAt(event, "big").isMismatch());
  std::int64_t out = 0;
  EXPECT_FALSE(asInteger(makeNumber(9223372036854775808.0), out));

  ASSERT_TRUE(integerAt(event, "min").ok());
  EXPECT_EQ(integerAt(event, "min").value(), std::numeric_limits<std::int64_t>::min());

  EXPECT_EQ(toDisplayString(*findPath(event, "big")), "9.22337203685478e+18");
  EXPECT_EQ(toDisplayString(*findPath(event, "min")), "-9223372036854775808");
}

TEST(ValueTest, DisplayStringFormatsScalars) {
  EXPECT_EQ(toDisplayString(makeNumber(2004)), "2004");
  EXPECT_EQ(toDisplayString(makeNumber(2.5)), "2.5");
  EXPECT_EQ(toDisplayString(makeString("security")), "security");
  EXPECT_EQ(toDisplayString(parseValue("true")), "true");
  EXPECT_EQ(toDisplayString(parseValue(R"({"a":1})")), R"({"a":1})");
}

TEST(ValueTest, ParseJsonAcceptsAnyDocument) {
  Value value;
  std::string error;

  ASSERT_TRUE(parseJson(R"([{"a":1},{"b":2}])", value, error)) << error;
  ASSERT_TRUE(isList(value));
  EXPECT_EQ(value.list_value().values_size(), 2);

  ASSERT_TRUE(parseJson("\"text\"", value, error)) << error;
  EXPECT_EQ(value.string_value(), "text");

  EXPECT_FALSE(parseJson("{\"a\":", value, error));
  EXPECT_FALSE(error.empty());
}

TEST(ValueTest, ToJsonProducesCompactOutput) {
  EXPECT_EQ(toJson(makeString("x")), "\"x\"");
  EXPECT_EQ(toJson(parseValue("[1,\"a\",null]")), "[1,\"a\",null]");
  EXPECT_EQ(toJson(Object()), "{}");
}
