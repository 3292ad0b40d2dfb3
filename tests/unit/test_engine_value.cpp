/**
 * @file test_engine_value.cpp
 * @brief Unit tests for engine value and corner string parsing
 */

#include <gtest/gtest.h>
#include "EngineValue.hpp"
#include "Exceptions.hpp"
#include "UnitSystem.hpp"

using namespace JOSHC;

TEST(EngineValueTest, ParsesNumberAndUnits) {
    EngineValue value = parseEngineValueString("30 m");
    EXPECT_DOUBLE_EQ(value.getValue(), 30.0);
    EXPECT_EQ(value.getUnits(), "m");
}

TEST(EngineValueTest, IgnoresSurroundingWhitespace) {
    EngineValue value = parseEngineValueString("  -118.5   degrees  ");
    EXPECT_DOUBLE_EQ(value.getValue(), -118.5);
    EXPECT_EQ(value.getUnits(), "degrees");
}

TEST(EngineValueTest, UnitsMayContainSpaces) {
    EngineValue value = parseEngineValueString("36.5 degrees north");
    EXPECT_EQ(value.getUnits(), "degrees north");
}

TEST(EngineValueTest, ScientificNotation) {
    EngineValue value = parseEngineValueString("1.5e3 m");
    EXPECT_DOUBLE_EQ(value.getValue(), 1500.0);
}

TEST(EngineValueTest, MissingUnitsRejected) {
    EXPECT_THROW(parseEngineValueString("30"), FormatError);
    EXPECT_THROW(parseEngineValueString(""), FormatError);
    EXPECT_THROW(parseEngineValueString("   "), FormatError);
}

TEST(EngineValueTest, InvalidNumberRejected) {
    EXPECT_THROW(parseEngineValueString("abc m"), FormatError);
    EXPECT_THROW(parseEngineValueString("30x m"), FormatError);
}

TEST(EngineValueTest, FormatErrorKeepsRawText) {
    try {
        parseEngineValueString("thirty meters");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.getRawText(), "thirty meters");
    }
}

TEST(EngineValueTest, ConvertsWithUnitSystem) {
    UnitSystem units;
    EXPECT_DOUBLE_EQ(parseEngineValueString("1 km").getAsMeters(units), 1000.0);
    EXPECT_DOUBLE_EQ(parseEngineValueString("30 meters").getAsMeters(units), 30.0);
    EXPECT_NEAR(parseEngineValueString("3.14159265358979 rad").getAsDegrees(units), 180.0, 1e-9);
    EXPECT_THROW(parseEngineValueString("30 degrees").getAsMeters(units), std::runtime_error);
}

TEST(StartEndStringTest, LatitudeFirst) {
    StartEndString corner = parseStartEndString(
        "36.51947777043374 degrees latitude, -118.67203360913730 degrees longitude");
    EXPECT_DOUBLE_EQ(corner.getLatitude().getValue(), 36.51947777043374);
    EXPECT_DOUBLE_EQ(corner.getLongitude().getValue(), -118.67203360913730);
    EXPECT_EQ(corner.getLatitude().getUnits(), "degrees");
}

TEST(StartEndStringTest, LongitudeFirst) {
    StartEndString corner = parseStartEndString("-118.6 degrees longitude, 36.5 degrees latitude");
    EXPECT_DOUBLE_EQ(corner.getLatitude().getValue(), 36.5);
    EXPECT_DOUBLE_EQ(corner.getLongitude().getValue(), -118.6);
}

TEST(StartEndStringTest, WrongPartCountRejected) {
    EXPECT_THROW(parseStartEndString("36.5 degrees latitude"), FormatError);
    EXPECT_THROW(parseStartEndString("1 a b, 2 c d, 3 e f"), FormatError);
    EXPECT_THROW(parseStartEndString("36.5 degrees latitude,"), FormatError);
}

TEST(StartEndStringTest, TooFewTokensRejected) {
    EXPECT_THROW(parseStartEndString("36.5 degrees, -118.6 degrees longitude"), FormatError);
}

TEST(StartEndStringTest, BadNumberRejected) {
    EXPECT_THROW(parseStartEndString("north degrees latitude, -118.6 degrees longitude"),
                 FormatError);
}
