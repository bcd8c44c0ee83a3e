#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "quanta/algorithm/rational_parser.hpp"

using namespace quanta::algorithm;

class RationalParserTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static auto parse(std::string_view text) -> std::optional<Rational> {
        return parseRational(text);
    }
};

TEST_F(RationalParserTest, Integers) {
    EXPECT_EQ(parse("42"), Rational(42));
    EXPECT_EQ(parse("-17"), Rational(-17));
    EXPECT_EQ(parse("+7"), Rational(7));
    EXPECT_EQ(parse("007"), Rational(7));
    EXPECT_EQ(parse("123456789012345678901234567890")->toString(),
              "123456789012345678901234567890");
}

TEST_F(RationalParserTest, Decimals) {
    EXPECT_EQ(parse("1.50"), Rational(3, 2));
    EXPECT_EQ(parse("-0.25"), Rational(-1, 4));
    EXPECT_EQ(parse(".5"), Rational(1, 2));
    EXPECT_EQ(parse("5."), Rational(5));
    EXPECT_EQ(parse("0.1"), Rational(1, 10));
}

TEST_F(RationalParserTest, Exponents) {
    EXPECT_EQ(parse("1e3"), Rational(1000));
    EXPECT_EQ(parse("1.5E-2"), Rational(3, 200));
    EXPECT_EQ(parse("2.5e+1"), Rational(25));
    EXPECT_EQ(parse("-4e-1"), Rational(-2, 5));
}

TEST_F(RationalParserTest, Fractions) {
    EXPECT_EQ(parse("1/3"), Rational(1, 3));
    EXPECT_EQ(parse("5/9"), Rational(5, 9));
    EXPECT_EQ(parse("0.5/0.25"), Rational(2));
    EXPECT_EQ(parse("-1/-2"), Rational(1, 2));
    EXPECT_EQ(parse("6/-4"), Rational(-3, 2));
    EXPECT_EQ(parse("1e2/4"), Rational(25));
    EXPECT_EQ(parse("0/5"), Rational());
}

TEST_F(RationalParserTest, ZeroDenominatorIsNull) {
    EXPECT_EQ(parse("5/0"), std::nullopt);
    EXPECT_EQ(parse("1/0.000"), std::nullopt);
}

TEST_F(RationalParserTest, ZeroForms) {
    for (const char* text : {"0", "0.0", "-0", "0.000", "+0e5", "0e99999"}) {
        auto value = parse(text);
        ASSERT_TRUE(value.has_value()) << text;
        EXPECT_TRUE(value->isZero()) << text;
        EXPECT_FALSE(value->isNegative()) << text;
        EXPECT_EQ(value->getDenominator(), BigInteger(1)) << text;
    }
}

TEST_F(RationalParserTest, SurroundingWhitespace) {
    EXPECT_EQ(parse("  12  "), Rational(12));
    EXPECT_EQ(parse("\t1/4\n"), Rational(1, 4));
}

TEST_F(RationalParserTest, RejectsMalformedText) {
    for (const char* text :
         {"", "   ", "abc", "1.2.3", "1e", "1e+", "--1", "+-1", "1/2/3",
          "1 2", "/2", "1/", ".", "-", "0x10", "1,5", "NaN", "Infinity"}) {
        EXPECT_EQ(parse(text), std::nullopt) << "'" << text << "'";
    }
}

TEST_F(RationalParserTest, LargeScales) {
    EXPECT_EQ(parse("1e10001"),
              Rational(BigInteger::pow10(10001), BigInteger(1)));
    EXPECT_EQ(parse("1e-10001"),
              Rational(BigInteger(1), BigInteger::pow10(10001)));
    EXPECT_EQ(parse("0." + std::string(10000, '0') + "1"),
              Rational(BigInteger(1), BigInteger::pow10(10001)));
    EXPECT_EQ(parse("25e-20001"),
              Rational(BigInteger(1), BigInteger(4) * BigInteger::pow10(19999)));
    EXPECT_EQ(parse("1e99999999999999999999"), std::nullopt);
    EXPECT_EQ(parse("0e99999999999999999999"), Rational());
}

TEST_F(RationalParserTest, Floats) {
    EXPECT_EQ(parseRational(0.1), Rational(1, 10));
    EXPECT_EQ(parseRational(-2.5), Rational(-5, 2));
    EXPECT_EQ(parseRational(1e-7), Rational(BigInteger(1), BigInteger::pow10(7)));
    EXPECT_EQ(parseRational(0.1 + 0.2),
              Rational(BigInteger("30000000000000004"),
                       BigInteger::pow10(17)));
    EXPECT_EQ(parseRational(1e21), Rational(BigInteger::pow10(21), BigInteger(1)));
}

TEST_F(RationalParserTest, FloatZeroAndNonFinite) {
    auto negativeZero = parseRational(-0.0);
    ASSERT_TRUE(negativeZero.has_value());
    EXPECT_TRUE(negativeZero->isZero());
    EXPECT_EQ(negativeZero->getDenominator(), BigInteger(1));

    EXPECT_EQ(parseRational(std::numeric_limits<double>::quiet_NaN()),
              std::nullopt);
    EXPECT_EQ(parseRational(std::numeric_limits<double>::infinity()),
              std::nullopt);
    EXPECT_EQ(parseRational(-std::numeric_limits<double>::infinity()),
              std::nullopt);
}

TEST_F(RationalParserTest, NumericAlternatives) {
    EXPECT_EQ(parseNumeric(Numeric{}), std::nullopt);
    EXPECT_EQ(parseNumeric(Rational(2, 4)), Rational(1, 2));
    EXPECT_EQ(parseNumeric(std::string("3/4")), Rational(3, 4));
    EXPECT_EQ(parseNumeric(2.5), Rational(5, 2));
    EXPECT_EQ(parseNumeric(std::string("oops")), std::nullopt);
}
