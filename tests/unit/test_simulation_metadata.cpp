/**
 * @file test_simulation_metadata.cpp
 * @brief Unit tests for SimulationMetadata
 */

#include <gtest/gtest.h>
#include "SimulationMetadata.hpp"
#include "Exceptions.hpp"

using namespace JOSHC;

TEST(SimulationMetadataTest, DefaultHasNoDegrees) {
    SimulationMetadata metadata;
    EXPECT_FALSE(metadata.hasDegrees());
    EXPECT_THROW(metadata.getTopLeft(), InvalidArgument);
    EXPECT_EQ(metadata.getTotalSteps(), 1);
}

TEST(SimulationMetadataTest, GridOnly) {
    SimulationMetadata metadata(0, 0, 100, 50, 30.0);
    EXPECT_DOUBLE_EQ(metadata.getWidth(), 100.0);
    EXPECT_DOUBLE_EQ(metadata.getHeight(), 50.0);
    EXPECT_DOUBLE_EQ(metadata.getPatchSize(), 30.0);
    EXPECT_FALSE(metadata.hasDegrees());
    EXPECT_THROW(SimulationMetadata(0, 0, 1, 1, 0.0), InvalidArgument);
}

TEST(SimulationMetadataTest, FromStartEndAnyCornerOrder) {
    StartEndString a = parseStartEndString("36.42 degrees latitude, -118.68 degrees longitude");
    StartEndString b = parseStartEndString("-118.57 degrees longitude, 36.52 degrees latitude");

    SimulationMetadata metadata = SimulationMetadata::fromStartEnd(a, b, parseEngineValueString("30 m"));
    EXPECT_TRUE(metadata.hasDegrees());
    EXPECT_DOUBLE_EQ(metadata.getMinLongitude(), -118.68);
    EXPECT_DOUBLE_EQ(metadata.getMaxLongitude(), -118.57);
    EXPECT_DOUBLE_EQ(metadata.getMinLatitude(), 36.42);
    EXPECT_DOUBLE_EQ(metadata.getMaxLatitude(), 36.52);

    EarthPoint top_left = metadata.getTopLeft();
    EXPECT_DOUBLE_EQ(top_left.longitude, -118.68);
    EXPECT_DOUBLE_EQ(top_left.latitude, 36.52);

    SimulationMetadata swapped = SimulationMetadata::fromStartEnd(b, a, parseEngineValueString("30 m"));
    EXPECT_DOUBLE_EQ(swapped.getTopLeft().longitude, top_left.longitude);
    EXPECT_DOUBLE_EQ(swapped.getTopLeft().latitude, top_left.latitude);
}

TEST(SimulationMetadataTest, GridExtentInPatches) {
    SimulationMetadata metadata = SimulationMetadata::fromStartEnd(
        parseStartEndString("36.52 degrees latitude, -118.68 degrees longitude"),
        parseStartEndString("36.42 degrees latitude, -118.57 degrees longitude"),
        parseEngineValueString("1 km"));

    EXPECT_DOUBLE_EQ(metadata.getPatchSize(), 1000.0);

    // 0.1 degrees of latitude is about 11.1 km
    EXPECT_NEAR(metadata.getEndY(), 11.12, 0.05);
    // 0.11 degrees of longitude at 36.52N is about 9.83 km
    EXPECT_NEAR(metadata.getEndX(), 9.83, 0.05);
}

TEST(SimulationMetadataTest, PatchSizeUnitsChecked) {
    StartEndString corner = parseStartEndString("36.5 degrees latitude, -118.6 degrees longitude");
    EXPECT_THROW(SimulationMetadata::fromStartEnd(corner, corner, parseEngineValueString("30 degrees")),
                 std::runtime_error);
    EXPECT_THROW(SimulationMetadata::fromStartEnd(corner, corner, parseEngineValueString("-1 m")),
                 InvalidArgument);
}

TEST(SimulationMetadataTest, Steps) {
    SimulationMetadata metadata;
    metadata.setSteps(2, 11);
    EXPECT_EQ(metadata.getStepsLow(), 2);
    EXPECT_EQ(metadata.getStepsHigh(), 11);
    EXPECT_EQ(metadata.getTotalSteps(), 10);
    EXPECT_THROW(metadata.setSteps(5, 4), InvalidArgument);
}
