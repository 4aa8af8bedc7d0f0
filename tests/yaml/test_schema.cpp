#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "yamlet/yaml/schema.hpp"

using namespace yamlet;

class CoreSchemaTest : public ::testing::Test {
protected:
    const Schema& schema = CoreSchema::instance();
};

TEST_F(CoreSchemaTest, NullLiterals) {
    EXPECT_EQ(schema.tagFor(""), ScalarTag::Null);
    EXPECT_EQ(schema.tagFor("~"), ScalarTag::Null);
    EXPECT_EQ(schema.tagFor("null"), ScalarTag::Null);
    EXPECT_EQ(schema.tagFor("Null"), ScalarTag::Null);
    EXPECT_EQ(schema.tagFor("NULL"), ScalarTag::Null);
    EXPECT_EQ(schema.tagFor("nULL"), ScalarTag::String);
}

TEST_F(CoreSchemaTest, BoolLiteralsAreCaseInsensitive) {
    for (const char* text : {"true", "True", "TRUE", "false", "FALSE", "yes",
                             "Yes", "no", "NO"}) {
        EXPECT_EQ(schema.tagFor(text), ScalarTag::Bool) << text;
    }
    EXPECT_EQ(schema.tagFor("y"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("on"), ScalarTag::String);
}

TEST_F(CoreSchemaTest, Integers) {
    EXPECT_EQ(schema.tagFor("0"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("42"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("-17"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("+5"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("0x1F"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("0o17"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("0o19"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("12a"), ScalarTag::String);
}

TEST_F(CoreSchemaTest, Floats) {
    EXPECT_EQ(schema.tagFor("1.5"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor(".5"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor("1e10"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor("-2.5E-3"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor(".inf"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor("-.Inf"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor(".NaN"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor("1e"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("."), ScalarTag::String);
}

TEST_F(CoreSchemaTest, EverythingElseIsString) {
    EXPECT_EQ(schema.tagFor("hello"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("1.2.3"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("Rex"), ScalarTag::String);
}

TEST(JsonSchemaTest, OnlyJsonLiterals) {
    const Schema& schema = JsonSchema::instance();
    EXPECT_EQ(schema.tagFor("null"), ScalarTag::Null);
    EXPECT_EQ(schema.tagFor("~"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("true"), ScalarTag::Bool);
    EXPECT_EQ(schema.tagFor("yes"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("-12"), ScalarTag::Int);
    EXPECT_EQ(schema.tagFor("+12"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("1.5e3"), ScalarTag::Float);
    EXPECT_EQ(schema.tagFor(".5"), ScalarTag::String);
}

TEST(FailsafeSchemaTest, EverythingIsString) {
    const Schema& schema = FailsafeSchema::instance();
    EXPECT_EQ(schema.tagFor("null"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("12"), ScalarTag::String);
    EXPECT_EQ(schema.tagFor("true"), ScalarTag::String);
}

TEST(TagNameTest, ResolvesShortAndLongForms) {
    EXPECT_EQ(tagFromName("!!int"), ScalarTag::Int);
    EXPECT_EQ(tagFromName("!!str"), ScalarTag::String);
    EXPECT_EQ(tagFromName("tag:yaml.org,2002:bool"), ScalarTag::Bool);
    EXPECT_EQ(tagFromName("!custom"), std::nullopt);
    EXPECT_EQ(tagFromName("!!map"), std::nullopt);
}

TEST(ScalarParseTest, Bool) {
    EXPECT_EQ(schema::parseBool("Yes"), true);
    EXPECT_EQ(schema::parseBool("FALSE"), false);
    EXPECT_EQ(schema::parseBool("maybe"), std::nullopt);
}

TEST(ScalarParseTest, Int64) {
    EXPECT_EQ(schema::parseInt64("42"), 42);
    EXPECT_EQ(schema::parseInt64("-42"), -42);
    EXPECT_EQ(schema::parseInt64("+7"), 7);
    EXPECT_EQ(schema::parseInt64("0x1f"), 31);
    EXPECT_EQ(schema::parseInt64("0o17"), 15);
    EXPECT_EQ(schema::parseInt64("9223372036854775807"),
              std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(schema::parseInt64("9223372036854775808"), std::nullopt);
    EXPECT_EQ(schema::parseInt64("4x"), std::nullopt);
    EXPECT_EQ(schema::parseInt64(""), std::nullopt);
}

TEST(ScalarParseTest, UInt64) {
    EXPECT_EQ(schema::parseUInt64("18446744073709551615"),
              std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(schema::parseUInt64("-1"), std::nullopt);
}

TEST(ScalarParseTest, Double) {
    EXPECT_DOUBLE_EQ(*schema::parseDouble("1.5"), 1.5);
    EXPECT_DOUBLE_EQ(*schema::parseDouble("-2e3"), -2000.0);
    EXPECT_TRUE(std::isinf(*schema::parseDouble(".inf")));
    EXPECT_LT(*schema::parseDouble("-.inf"), 0.0);
    EXPECT_TRUE(std::isnan(*schema::parseDouble(".nan")));
    EXPECT_EQ(schema::parseDouble("abc"), std::nullopt);
}

TEST(ScalarFormatTest, DoubleStaysFloat) {
    EXPECT_EQ(schema::formatDouble(1.5), "1.5");
    EXPECT_EQ(schema::formatDouble(3.0), "3.0");
    EXPECT_EQ(schema::formatDouble(std::numeric_limits<double>::infinity()),
              ".inf");
    EXPECT_EQ(schema::formatDouble(-std::numeric_limits<double>::infinity()),
              "-.inf");
    EXPECT_EQ(schema::formatDouble(std::nan("")), ".nan");
    EXPECT_EQ(tagFor(schema::formatDouble(1e21)), ScalarTag::Float);
}

TEST(ScalarFormatTest, FormattedValuesParseBack) {
    for (double value : {0.1, -123.456, 1e-7, 6.02214076e23}) {
        auto text = schema::formatDouble(value);
        EXPECT_EQ(tagFor(text), ScalarTag::Float) << text;
        EXPECT_DOUBLE_EQ(*schema::parseDouble(text), value);
    }
    EXPECT_EQ(schema::formatInt64(-9), "-9");
    EXPECT_EQ(schema::formatUInt64(18446744073709551615ULL),
              "18446744073709551615");
}
