/**
 * @file test_wire_protocol.cpp
 * @brief Unit tests for engine response line parsing and record encoding
 */

#include <gtest/gtest.h>
#include "WireProtocol.hpp"
#include "Exceptions.hpp"

using namespace JOSHC;

TEST(WireConverterTest, DeserializeNamedMap) {
    NamedMap parsed = WireConverter::deserializeFromString("patches:key1=value1\tkey2=value2");
    EXPECT_EQ(parsed.name, "patches");
    ASSERT_EQ(parsed.target.size(), 2u);
    EXPECT_EQ(parsed.target["key1"], "value1");
    EXPECT_EQ(parsed.target["key2"], "value2");
}

TEST(WireConverterTest, ValueKeepsEqualsSigns) {
    NamedMap parsed = WireConverter::deserializeFromString("simulation:expr=a=b");
    EXPECT_EQ(parsed.target["expr"], "a=b");
}

TEST(WireConverterTest, EmptyPairsSkippedAndDuplicatesOverwrite) {
    NamedMap parsed = WireConverter::deserializeFromString("patches:a=1\t\ta=2");
    ASSERT_EQ(parsed.target.size(), 1u);
    EXPECT_EQ(parsed.target["a"], "2");
}

TEST(WireConverterTest, NameOnly) {
    NamedMap parsed = WireConverter::deserializeFromString("entities:");
    EXPECT_EQ(parsed.name, "entities");
    EXPECT_TRUE(parsed.target.empty());
}

TEST(WireConverterTest, MalformedRejected) {
    EXPECT_THROW(WireConverter::deserializeFromString(""), FormatError);
    EXPECT_THROW(WireConverter::deserializeFromString("no colon"), FormatError);
    EXPECT_THROW(WireConverter::deserializeFromString(":a=1"), FormatError);
    EXPECT_THROW(WireConverter::deserializeFromString("patches:novalue"), FormatError);
    EXPECT_THROW(WireConverter::deserializeFromString("patches:=1"), FormatError);
}

TEST(WireConverterTest, SerializeReplacesLineBreaksInValues) {
    NamedMap datum;
    datum.name = "patches";
    datum.target["note"] = "a\tb\nc";
    datum.target["x"] = "1";

    std::string encoded = WireConverter::serializeToString(datum);
    EXPECT_EQ(encoded, "patches:note=a    b    c\tx=1");
    EXPECT_EQ(encoded.find('\n'), std::string::npos);

    NamedMap decoded = WireConverter::deserializeFromString(encoded);
    EXPECT_EQ(decoded.target["note"], "a    b    c");
    EXPECT_EQ(decoded.target["x"], "1");
}

TEST(WireConverterTest, SerializeRejectsStructuralCharacters) {
    EXPECT_THROW(WireConverter::serializeToString(NamedMap("", {{"a", "1"}})), FormatError);
    EXPECT_THROW(WireConverter::serializeToString(NamedMap("pat:ches", {{"a", "1"}})), FormatError);
    EXPECT_THROW(WireConverter::serializeToString(NamedMap("patches\n", {{"a", "1"}})), FormatError);

    EXPECT_THROW(WireConverter::serializeToString(NamedMap("patches", {{"", "1"}})), FormatError);
    EXPECT_THROW(WireConverter::serializeToString(NamedMap("patches", {{"a=b", "1"}})), FormatError);
    EXPECT_THROW(WireConverter::serializeToString(NamedMap("patches", {{"a\tb", "1"}})), FormatError);
    EXPECT_THROW(WireConverter::serializeToString(NamedMap("patches", {{"a\nb", "1"}})), FormatError);

    // Colons are only structural in the name
    std::string encoded = WireConverter::serializeToString(NamedMap("patches", {{"time:s", "a:b"}}));
    NamedMap decoded = WireConverter::deserializeFromString(encoded);
    EXPECT_EQ(decoded.name, "patches");
    EXPECT_EQ(decoded.target["time:s"], "a:b");
}

TEST(WireResponseParserTest, DatumLine) {
    ParsedResponse response = WireResponseParser::parseEngineResponse(
        "[3] patches:position.x=1.5\tposition.y=2.5\tstep=0");
    EXPECT_EQ(response.type, ResponseType::DATUM);
    EXPECT_EQ(response.replicate, 3);
    EXPECT_EQ(response.datum.name, "patches");
    EXPECT_EQ(response.datum.target["position.x"], "1.5");
    EXPECT_EQ(response.datum.target["step"], "0");
}

TEST(WireResponseParserTest, EndLine) {
    ParsedResponse response = WireResponseParser::parseEngineResponse("[end 12]");
    EXPECT_EQ(response.type, ResponseType::END);
    EXPECT_EQ(response.replicate, 12);
}

TEST(WireResponseParserTest, ProgressLine) {
    ParsedResponse response = WireResponseParser::parseEngineResponse("[progress 42]");
    EXPECT_EQ(response.type, ResponseType::PROGRESS);
    EXPECT_EQ(response.step_count, 42);
}

TEST(WireResponseParserTest, ErrorLine) {
    ParsedResponse response = WireResponseParser::parseEngineResponse("[error] Out of memory");
    EXPECT_EQ(response.type, ResponseType::ENGINE_ERROR);
    EXPECT_EQ(response.error_message, "Out of memory");
}

TEST(WireResponseParserTest, IgnoredLines) {
    EXPECT_EQ(WireResponseParser::parseEngineResponse("").type, ResponseType::IGNORED);
    EXPECT_EQ(WireResponseParser::parseEngineResponse("   \r").type, ResponseType::IGNORED);
    EXPECT_EQ(WireResponseParser::parseEngineResponse("[4]").type, ResponseType::IGNORED);
}

TEST(WireResponseParserTest, CarriageReturnTrimmed) {
    ParsedResponse response = WireResponseParser::parseEngineResponse("[end 1]\r");
    EXPECT_EQ(response.type, ResponseType::END);
    EXPECT_EQ(response.replicate, 1);
}

TEST(WireResponseParserTest, InvalidLinesRejected) {
    EXPECT_THROW(WireResponseParser::parseEngineResponse("hello"), FormatError);
    EXPECT_THROW(WireResponseParser::parseEngineResponse("[abc] patches:a=1"), FormatError);
    EXPECT_THROW(WireResponseParser::parseEngineResponse("[end x]"), FormatError);
    EXPECT_THROW(WireResponseParser::parseEngineResponse("[progress]"), FormatError);
    EXPECT_THROW(WireResponseParser::parseEngineResponse("[1]patches:a=1"), FormatError);
    EXPECT_THROW(WireResponseParser::parseEngineResponse("[1] patches"), FormatError);
    EXPECT_THROW(WireResponseParser::parseEngineResponse("[99999999999] patches:a=1"), FormatError);
}

TEST(WireResponseParserTest, FormattersProduceParsableLines) {
    NamedMap datum;
    datum.name = "simulation";
    datum.target["step"] = "5";

    EXPECT_EQ(WireResponseParser::formatDatum(2, datum), "[2] simulation:step=5");
    EXPECT_EQ(WireResponseParser::formatEnd(2), "[end 2]");
    EXPECT_EQ(WireResponseParser::formatProgress(7), "[progress 7]");

    ParsedResponse response = WireResponseParser::parseEngineResponse(
        WireResponseParser::formatDatum(2, datum));
    EXPECT_EQ(response.replicate, 2);
    EXPECT_EQ(response.datum.target["step"], "5");
}
