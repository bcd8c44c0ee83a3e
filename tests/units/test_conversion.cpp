#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "quanta/algorithm/decimal_format.hpp"
#include "quanta/units/conversion.hpp"
#include "test_units_map.hpp"

using namespace quanta::units;
using quanta::algorithm::BigInteger;
using quanta::algorithm::parseRational;

class ConversionTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        catalog = test::makeTestCatalog();
    }

    auto unit(std::string_view id) const -> const Unit& {
        const Unit* found = catalog->find(id);
        if (found == nullptr) {
            throw std::runtime_error("missing test unit " + std::string(id));
        }
        return *found;
    }

    std::shared_ptr<const UnitCatalog> catalog;
};

TEST_F(ConversionTest, MilliampereToReference) {
    auto reference = toReference(std::string("10"), unit("unit:MilliA"));
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(*reference, Rational(1, 100));
    EXPECT_EQ(toReferenceText(std::string("10"), unit("unit:MilliA")).value(),
              "0.01");
}

TEST_F(ConversionTest, MilliampereFromReference) {
    auto display = fromReference(std::string("0.01"), unit("unit:MilliA"));
    ASSERT_TRUE(display.has_value());
    EXPECT_EQ(*display, Rational(10));
    EXPECT_EQ(fromReferenceText(10.0, unit("unit:MilliA")).value(), "10000");
}

TEST_F(ConversionTest, FahrenheitIsExact) {
    const Unit& fahrenheit = unit("unit:DEG_F");
    EXPECT_EQ(toReference(std::string("32"), fahrenheit).value(),
              Rational(5463, 20));
    EXPECT_EQ(toReferenceText(std::string("32"), fahrenheit).value(),
              "273.15");
    EXPECT_EQ(toReferenceText(std::string("212"), fahrenheit).value(),
              "373.15");
    EXPECT_EQ(fromReferenceText(std::string("273.15"), fahrenheit).value(),
              "32");
    EXPECT_EQ(toReferenceText(std::string("-459.67"), fahrenheit).value(),
              "0");
}

TEST_F(ConversionTest, CelsiusOffset) {
    const Unit& celsius = unit("unit:DEG_C");
    EXPECT_EQ(toReferenceText(std::string("0"), celsius).value(), "273.15");
    EXPECT_EQ(toReferenceText(std::string("-273.15"), celsius).value(), "0");
    EXPECT_EQ(fromReferenceText(std::string("0"), celsius).value(), "-273.15");
}

TEST_F(ConversionTest, ConvertWithinFamily) {
    EXPECT_EQ(convertText(std::string("100"), unit("unit:DEG_C"),
                          unit("unit:DEG_F"))
                  .value(),
              "212");
    EXPECT_EQ(convertText(std::string("1"), unit("unit:CentiM"),
                          unit("unit:M"))
                  .value(),
              "0.01");
    EXPECT_EQ(convertText(std::string("2.5"), unit("unit:M"),
                          unit("unit:MicroM"))
                  .value(),
              "2500000");
    EXPECT_EQ(convertText(std::string("1"), unit("unit:DEG_F"),
                          unit("unit:DEG_C"))
                  .value(),
              "-17.222222222222222222222222");
}

TEST_F(ConversionTest, RoundTripIsExact) {
    const Rational third(1, 3);
    auto there = convert(third, unit("unit:M"), unit("unit:CentiM"));
    ASSERT_TRUE(there.has_value());
    EXPECT_EQ(*there, Rational(100, 3));
    auto back = convert(*there, unit("unit:CentiM"), unit("unit:M"));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, third);
}

TEST_F(ConversionTest, FloatInputUsesShortestText) {
    EXPECT_EQ(toReferenceText(0.1, unit("unit:MilliA")).value(), "0.0001");
    EXPECT_EQ(toReference(0.1 + 0.2, unit("unit:A")).value(),
              Rational(BigInteger("30000000000000004"),
                       BigInteger::pow10(17)));
}

TEST_F(ConversionTest, IdentityForReferenceUnit) {
    const Unit& kelvin = unit("unit:K");
    EXPECT_EQ(toReference(std::string("1/7"), kelvin).value(), Rational(1, 7));
    EXPECT_EQ(fromReference(Rational(1, 7), kelvin).value(), Rational(1, 7));
}

TEST_F(ConversionTest, IncompatibleUnits) {
    auto result = convert(std::string("1"), unit("unit:KiloGM"), unit("unit:M"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, UnitErrorCode::IncompatibleUnits);

    auto text = convertText(std::string("1"), unit("unit:A"), unit("unit:K"));
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, UnitErrorCode::IncompatibleUnits);
}

TEST_F(ConversionTest, LogarithmicUnitsAreRejected) {
    const Unit& decibel = unit("unit:DeciB");
    EXPECT_EQ(toReference(std::string("10"), decibel).error().code,
              UnitErrorCode::UnsupportedUnitKind);
    EXPECT_EQ(fromReference(std::string("1"), decibel).error().code,
              UnitErrorCode::UnsupportedUnitKind);
    EXPECT_EQ(convert(std::string("1"), decibel, unit("unit:B")).error().code,
              UnitErrorCode::UnsupportedUnitKind);
    // Logarithmic check comes before the compatibility check.
    EXPECT_EQ(convert(std::string("1"), unit("unit:M"), decibel).error().code,
              UnitErrorCode::UnsupportedUnitKind);
}

TEST_F(ConversionTest, InvalidNumbers) {
    const Unit& metre = unit("unit:M");
    EXPECT_EQ(toReference(std::string("abc"), metre).error().code,
              UnitErrorCode::InvalidNumber);
    EXPECT_EQ(toReference(std::string(""), metre).error().code,
              UnitErrorCode::InvalidNumber);
    EXPECT_EQ(toReference(Numeric{}, metre).error().code,
              UnitErrorCode::InvalidNumber);
    EXPECT_EQ(fromReference(std::string("1/0"), metre).error().code,
              UnitErrorCode::InvalidNumber);
    EXPECT_EQ(convert(std::numeric_limits<double>::infinity(), metre,
                      unit("unit:CentiM"))
                  .error()
                  .code,
              UnitErrorCode::InvalidNumber);
}

TEST_F(ConversionTest, ZeroMultiplier) {
    Unit broken;
    broken.id = "unit:Broken";
    broken.multiplier = Rational();
    broken.offset = Rational(3);

    EXPECT_EQ(toReference(std::string("5"), broken).value(), Rational(3));
    auto display = fromReference(std::string("5"), broken);
    ASSERT_FALSE(display.has_value());
    EXPECT_EQ(display.error().code, UnitErrorCode::DivisionByZero);
}

TEST_F(ConversionTest, ErrorKindNames) {
    EXPECT_EQ(toString(UnitErrorCode::InvalidNumber), "InvalidNumber");
    EXPECT_EQ(toString(UnitErrorCode::DivisionByZero), "DivisionByZero");
    EXPECT_EQ(toString(UnitErrorCode::IncompatibleUnits), "IncompatibleUnits");
    EXPECT_EQ(toString(UnitErrorCode::UnsupportedUnitKind),
              "UnsupportedUnitKind");
    EXPECT_EQ(toString(UnitErrorCode::DataIntegrityError),
              "DataIntegrityError");
}

TEST_F(ConversionTest, InverseLawHoldsForEveryAffineUnit) {
    const std::vector<Rational> values{
        Rational(), Rational(1, 3), Rational(-459, 7), Rational(10),
        Rational(BigInteger::pow10(30), BigInteger(7))};
    for (const auto& unit : catalog->units()) {
        if (unit.isLogarithmic) {
            continue;
        }
        for (const auto& value : values) {
            auto reference = toReference(value, unit);
            ASSERT_TRUE(reference.has_value()) << unit.id;
            auto back = fromReference(*reference, unit);
            ASSERT_TRUE(back.has_value()) << unit.id;
            EXPECT_EQ(*back, value) << unit.id << " " << value;
        }
    }
}
