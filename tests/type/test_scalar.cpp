#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "yconf/type/scalar.hpp"

namespace yconf::type::test {

class ScalarTest : public ::testing::Test {
protected:
    static auto plain(const std::string& text) -> Scalar {
        return {text, ScalarStyle::Plain};
    }
};

TEST_F(ScalarTest, ClassifiesNullSpellings) {
    for (const auto* text : {"", "~", "null", "Null", "NULL"}) {
        EXPECT_EQ(classify(text, ScalarStyle::Plain), ScalarKind::Null)
            << text;
    }
    EXPECT_EQ(classify("nULL", ScalarStyle::Plain), ScalarKind::String);
}

TEST_F(ScalarTest, ClassifiesBooleansCaseInsensitively) {
    for (const auto* text : {"true", "Yes", "on", "TRUE", "false", "No",
                             "OFF"}) {
        EXPECT_EQ(classify(text, ScalarStyle::Plain), ScalarKind::Boolean)
            << text;
    }
    EXPECT_TRUE(plain("true").as<bool>());
    EXPECT_TRUE(plain("Yes").as<bool>());
    EXPECT_TRUE(plain("on").as<bool>());
    EXPECT_FALSE(plain("off").as<bool>());
}

TEST_F(ScalarTest, ClassifiesIntegerRadixes) {
    EXPECT_EQ(plain("0xFF").kind(), ScalarKind::Integer);
    EXPECT_EQ(plain("0xFF").as<int>(), 255);
    EXPECT_EQ(plain("0o17").as<int>(), 15);
    EXPECT_EQ(plain("0b101").as<int>(), 5);
    EXPECT_EQ(plain("-42").as<std::int64_t>(), -42);
    EXPECT_EQ(plain("+7").as<long>(), 7);
    EXPECT_EQ(plain("0x").kind(), ScalarKind::String);
    EXPECT_EQ(plain("0b102").kind(), ScalarKind::String);
}

TEST_F(ScalarTest, ClassifiesReals) {
    for (const auto* text : {"1.5", ".5", "1.", "1e5", "-2.5E-3", ".inf",
                             "+.inf", "-.Inf", ".nan", ".NaN"}) {
        EXPECT_EQ(classify(text, ScalarStyle::Plain), ScalarKind::Real)
            << text;
    }
    EXPECT_DOUBLE_EQ(plain("-2.5E-3").as<double>(), -0.0025);
    EXPECT_EQ(plain(".inf").as<double>(),
              std::numeric_limits<double>::infinity());
    EXPECT_EQ(plain("-.inf").as<double>(),
              -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(std::isnan(plain(".nan").as<double>()));
    EXPECT_EQ(classify("1e", ScalarStyle::Plain), ScalarKind::String);
    EXPECT_EQ(classify(".", ScalarStyle::Plain), ScalarKind::String);
}

TEST_F(ScalarTest, QuotedAndBlockScalarsAreStrings) {
    EXPECT_EQ(classify("42", ScalarStyle::DoubleQuoted), ScalarKind::String);
    EXPECT_EQ(classify("true", ScalarStyle::SingleQuoted),
              ScalarKind::String);
    EXPECT_EQ(classify("null", ScalarStyle::Literal), ScalarKind::String);
    EXPECT_EQ(classify("1.5", ScalarStyle::Folded), ScalarKind::String);
}

TEST_F(ScalarTest, IntegerWidensToReal) {
    EXPECT_DOUBLE_EQ(plain("3").as<double>(), 3.0);
    EXPECT_FLOAT_EQ(plain("0x10").as<float>(), 16.0F);
}

TEST_F(ScalarTest, DigitStringsAreCoercedForNumericReads) {
    Scalar quoted("123", ScalarStyle::DoubleQuoted);
    EXPECT_EQ(quoted.kind(), ScalarKind::String);
    EXPECT_EQ(quoted.as<int>(), 123);
    EXPECT_DOUBLE_EQ(quoted.as<double>(), 123.0);
    EXPECT_EQ(quoted.as<std::string>(), "123");

    Scalar word("two", ScalarStyle::DoubleQuoted);
    EXPECT_THROW((void)word.as<int>(), error::TypeError);
    EXPECT_THROW((void)word.as<double>(), error::TypeError);
}

TEST_F(ScalarTest, StringReadsAreStrict) {
    EXPECT_THROW((void)plain("42").as<std::string>(), error::TypeError);
    EXPECT_THROW((void)plain("true").as<std::string>(), error::TypeError);
    EXPECT_EQ(plain("hello").as<std::string>(), "hello");
}

TEST_F(ScalarTest, MismatchesThrowTypeError) {
    EXPECT_THROW((void)plain("1.5").as<int>(), error::TypeError);
    EXPECT_THROW((void)plain("hello").as<bool>(), error::TypeError);
    EXPECT_THROW((void)plain("1").as<bool>(), error::TypeError);
    EXPECT_THROW((void)plain("~").as<double>(), error::TypeError);
}

TEST_F(ScalarTest, IntegersOutsideSixtyFourBitsAreRejected) {
    auto huge = plain("99999999999999999999");
    EXPECT_EQ(huge.kind(), ScalarKind::Integer);
    EXPECT_THROW((void)huge.as<std::int64_t>(), error::TypeError);
    EXPECT_EQ(plain("-9223372036854775808").as<std::int64_t>(),
              std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(plain("9223372036854775807").as<std::int64_t>(),
              std::numeric_limits<std::int64_t>::max());
}

TEST_F(ScalarTest, NarrowingIsRangeChecked) {
    EXPECT_EQ(plain("127").as<std::int8_t>(), 127);
    EXPECT_THROW((void)plain("128").as<std::int8_t>(), error::TypeError);
    EXPECT_THROW((void)plain("-1").as<unsigned int>(), error::TypeError);
    EXPECT_EQ(plain("4294967295").as<std::uint32_t>(), 4294967295U);
}

TEST_F(ScalarTest, TaggedKindOverridesClassification) {
    Scalar tagged("12", ScalarStyle::Plain, ScalarKind::String);
    EXPECT_TRUE(tagged.is_tagged());
    EXPECT_EQ(tagged.kind(), ScalarKind::String);
    EXPECT_EQ(tagged.as<std::string>(), "12");

    Scalar real("1", ScalarStyle::Plain, ScalarKind::Real);
    EXPECT_EQ(real.kind(), ScalarKind::Real);
    EXPECT_DOUBLE_EQ(real.as<double>(), 1.0);
}

TEST_F(ScalarTest, FromValuesKeepsTheirKind) {
    EXPECT_EQ(Scalar::from(true).text(), "true");
    EXPECT_EQ(Scalar::from(true).kind(), ScalarKind::Boolean);
    EXPECT_EQ(Scalar::from(42).kind(), ScalarKind::Integer);
    EXPECT_EQ(Scalar::from(2.0).text(), "2.0");
    EXPECT_EQ(Scalar::from(2.0).kind(), ScalarKind::Real);
    EXPECT_EQ(Scalar::from(std::string("42")).kind(), ScalarKind::String);
    EXPECT_EQ(Scalar::from(std::numeric_limits<double>::infinity()).text(),
              ".inf");
}

TEST_F(ScalarTest, FormatRealIsReadBackAsReal) {
    EXPECT_EQ(format_real(1.5), "1.5");
    EXPECT_EQ(format_real(3.0), "3.0");
    EXPECT_EQ(format_real(-std::numeric_limits<double>::infinity()), "-.inf");
    EXPECT_EQ(format_real(std::numeric_limits<double>::quiet_NaN()), ".nan");
    EXPECT_EQ(classify(format_real(1e300), ScalarStyle::Plain),
              ScalarKind::Real);
}

TEST_F(ScalarTest, SameValueIgnoresSpelling) {
    EXPECT_TRUE(plain("0xFF").same_value(plain("255")));
    EXPECT_TRUE(plain("yes").same_value(plain("true")));
    EXPECT_TRUE(plain("~").same_value(plain("")));
    EXPECT_TRUE(plain(".nan").same_value(plain(".NaN")));
    EXPECT_TRUE(plain("1.0").same_value(plain("1.")));
    EXPECT_FALSE(plain("1").same_value(plain("1.0")));
    EXPECT_FALSE(plain("1").same_value(Scalar("1", ScalarStyle::SingleQuoted)));
}

}  // namespace yconf::type::test
