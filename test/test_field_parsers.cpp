// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/FieldParsers.hpp"

using namespace knet_reader;
using namespace knet_reader::io;

TEST(FieldParsersTest, SplitsOnWhitespaceRuns) {
    const auto tokens = splitWhitespace("  Scale Factor\t 2000(gal)/8388608\r");
    ASSERT_EQ(3u, tokens.size());
    EXPECT_EQ("Scale", tokens[0]);
    EXPECT_EQ("Factor", tokens[1]);
    EXPECT_EQ("2000(gal)/8388608", tokens[2]);
    EXPECT_TRUE(splitWhitespace("   ").empty());
}

TEST(FieldParsersTest, LeadingDigits) {
    EXPECT_EQ("100", leadingDigits("100Hz"));
    EXPECT_EQ("", leadingDigits("Hz"));
    EXPECT_EQ("3920", leadingDigits("3920(gal)"));
}

TEST(FieldParsersTest, ParsesWholeNumbersOnly) {
    double value = 0.0;
    EXPECT_TRUE(parseDouble("-16", value));
    EXPECT_DOUBLE_EQ(-16.0, value);
    EXPECT_TRUE(parseDouble("1.5e3", value));
    EXPECT_DOUBLE_EQ(1500.0, value);
    EXPECT_FALSE(parseDouble("", value));
    EXPECT_FALSE(parseDouble("1.5x", value));
    EXPECT_FALSE(parseDouble(" 1", value));
    EXPECT_FALSE(parseDouble("abc", value));

    int rate = 0;
    EXPECT_TRUE(parseInt("200", rate));
    EXPECT_EQ(200, rate);
    EXPECT_FALSE(parseInt("", rate));
    EXPECT_FALSE(parseInt("2.5", rate));
}

TEST(FieldParsersTest, RemapsBoreholeChannels) {
    EXPECT_EQ("NS1", remapChannel("1"));
    EXPECT_EQ("EW1", remapChannel("2"));
    EXPECT_EQ("UD1", remapChannel("3"));
    EXPECT_EQ("NS2", remapChannel("4"));
    EXPECT_EQ("EW2", remapChannel("5"));
    EXPECT_EQ("UD2", remapChannel("6"));
}

TEST(FieldParsersTest, StripsDashesFromSurfaceChannels) {
    EXPECT_EQ("NS", remapChannel("N-S"));
    EXPECT_EQ("EW", remapChannel("E-W"));
    EXPECT_EQ("UD", remapChannel(" U-D "));
    EXPECT_EQ("0", remapChannel("0"));
    EXPECT_EQ("7", remapChannel("7"));
}

TEST(FieldParsersTest, KeepsStationCodeWithoutConversion) {
    const auto name = splitStationCode("AKT013", false);
    EXPECT_EQ("AKT013", name.station);
    EXPECT_EQ("", name.location);
}

TEST(FieldParsersTest, SplitsLocationFromLongStationCode) {
    const auto name = splitStationCode("ABCDEFGH", true);
    EXPECT_EQ("ABCDEF", name.station);
    EXPECT_EQ("GH", name.location);

    const auto short_name = splitStationCode("ABCDE", true);
    EXPECT_EQ("ABCDE", short_name.station);
    EXPECT_EQ("", short_name.location);
}

TEST(FieldParsersTest, RejectsOverlongStation) {
    try {
        splitStationCode("ABCDEFGHIJ", true);
        FAIL() << "Expected KnetException";
    } catch (const KnetException& e) {
        EXPECT_EQ(KnetErrorKind::StationNameTooLong, e.kind());
    }
    EXPECT_THROW(splitStationCode("ABCDEFGH", false), KnetException);
    EXPECT_NO_THROW(splitStationCode("ABCDEFG", false));
}

TEST(FieldParsersTest, ComputesCalibrationFactor) {
    EXPECT_DOUBLE_EQ(0.01 * 2000.0 / 8388608.0, computeCalibrationFactor("2000(gal)/8388608"));
    EXPECT_NEAR(2.3842e-6, computeCalibrationFactor("2000(gal)/8388608"), 1e-10);
    EXPECT_DOUBLE_EQ(0.01 * 3920.0 / 6182761.0, computeCalibrationFactor("3920(gal)/6182761"));
    EXPECT_DOUBLE_EQ(0.01 * 7845.0 / 8388608.0, computeCalibrationFactor("7845/8388608"));
}

TEST(FieldParsersTest, RejectsMalformedCalibration) {
    const char* bad[] = {"2000(gal)", "(gal)/8388608", "2000/abc", "2000/0", "1/2/3", ""};
    for (const char* text : bad) {
        try {
            computeCalibrationFactor(text);
            FAIL() << "Expected KnetException for '" << text << "'";
        } catch (const KnetException& e) {
            EXPECT_EQ(KnetErrorKind::MalformedCalibrationField, e.kind()) << text;
        }
    }
}
