// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/KnetReader.hpp"

using namespace knet_reader;
using knet_reader::io::DecodeOptions;
using knet_reader::io::KnetReader;

namespace {

const std::string kHeader =
    "Origin Time       2012/01/01 14:27:00\n"
    "Lat.              31.442\n"
    "Long.             138.072\n"
    "Depth. (km)       400\n"
    "Mag.              7.0\n"
    "Station Code      AKT013\n"
    "Station Lat.      39.2043\n"
    "Station Long.     140.0514\n"
    "Station Height(m) 20\n"
    "Record Time       2012/01/01 14:28:30\n"
    "Sampling Freq(Hz) 100Hz\n"
    "Duration Time(s)  130\n"
    "Dir.              E-W\n"
    "Scale Factor      2000(gal)/8388608\n"
    "Max. Acc. (gal)   0.267\n"
    "Last Correction   2012/01/01 14:28:15\n";

KnetErrorKind readErrorKind(const std::string& content, const DecodeOptions& options = {}) {
    std::istringstream stream(content);
    try {
        KnetReader::read(stream, options);
    } catch (const KnetException& e) {
        return e.kind();
    }
    ADD_FAILURE() << "read did not throw";
    return KnetErrorKind::IoError;
}

}  // namespace

TEST(KnetReaderTest, ReadsKnetFile) {
    const auto record = KnetReader::readFile(std::string(TEST_DATA_DIR) + "/AKT0131201011427.NS");

    EXPECT_EQ("BO", record.header.network_code);
    EXPECT_EQ("AKT013", record.header.station_code);
    EXPECT_EQ("NS", record.header.channel_code);
    EXPECT_EQ("BO.AKT013..NS", record.streamId());
    EXPECT_EQ(100, record.header.sampling_rate_hz);
    EXPECT_EQ("2012-01-01T05:28:15Z", formatIso8601(record.header.record_start_time));

    ASSERT_EQ(20u, record.sample_count);
    ASSERT_EQ(20u, record.samples.size());
    EXPECT_DOUBLE_EQ(-16.0, record.samples.front());
    EXPECT_DOUBLE_EQ(-17.0, record.samples[4]);
    EXPECT_DOUBLE_EQ(-16.0, record.samples.back());
    EXPECT_EQ("2012-01-01T05:28:15.190Z", formatIso8601(record.endTime()));
}

TEST(KnetReaderTest, ReadsKiknetBoreholeFile) {
    DecodeOptions options;
    options.convert_station_name = true;
    const auto record = KnetReader::readFile(std::string(TEST_DATA_DIR) + "/IWTH271103111446.UD1", options);

    EXPECT_EQ("IWTH", record.header.station_code);
    EXPECT_EQ("27", record.header.location_code);
    EXPECT_EQ("UD1", record.header.channel_code);
    EXPECT_EQ("2011-03-11T05:46:30Z", formatIso8601(record.header.record_start_time));
    EXPECT_EQ("2011-03-11T05:46:00Z", formatIso8601(record.header.event_origin_time));
    EXPECT_DOUBLE_EQ(0.01 * 3920.0 / 6182761.0, record.header.calibration_factor);
    ASSERT_TRUE(record.header.comment.has_value());
    EXPECT_EQ("borehole sensor", *record.header.comment);
    EXPECT_EQ(10u, record.sample_count);
    EXPECT_EQ("2011-03-11T05:46:30.045Z", formatIso8601(record.endTime()));
}

TEST(KnetReaderTest, AcceptsCrLfLineEndings) {
    std::string content = kHeader + "Memo.\n1 2 3\n4 5\n";
    std::string crlf;
    for (char c : content) {
        if (c == '\n') {
            crlf += '\r';
        }
        crlf += c;
    }
    std::istringstream stream(crlf);
    const auto record = KnetReader::read(stream);
    EXPECT_EQ("EW", record.header.channel_code);
    EXPECT_EQ(5u, record.sample_count);
    EXPECT_DOUBLE_EQ(5.0, record.samples.back());
}

TEST(KnetReaderTest, NoSamplesGivesEmptyRecord) {
    std::istringstream stream(kHeader + "Memo.\n");
    const auto record = KnetReader::read(stream);
    EXPECT_EQ(0u, record.sample_count);
    EXPECT_TRUE(record.samples.empty());
    EXPECT_EQ(record.header.record_start_time, record.endTime());
}

TEST(KnetReaderTest, BlankSampleLinesAreSkipped) {
    std::istringstream stream(kHeader + "Memo.\n1 2\n\n   \n3\n");
    const auto record = KnetReader::read(stream);
    ASSERT_EQ(3u, record.sample_count);
    EXPECT_DOUBLE_EQ(3.0, record.samples[2]);
}

TEST(KnetReaderTest, TruncatedHeader) {
    EXPECT_EQ(KnetErrorKind::PrematureEndOfHeader, readErrorKind(kHeader.substr(0, 200)));
    EXPECT_EQ(KnetErrorKind::PrematureEndOfHeader, readErrorKind(kHeader));
    EXPECT_EQ(KnetErrorKind::PrematureEndOfHeader, readErrorKind(""));
}

TEST(KnetReaderTest, EarlyMemoLineIsLabelMismatch) {
    EXPECT_EQ(KnetErrorKind::HeaderLabelMismatch,
              readErrorKind("Origin Time       2012/01/01 14:27:00\nMemo.\n1 2\n"));
}

TEST(KnetReaderTest, BadSampleNamesLineAndToken) {
    std::istringstream stream(kHeader + "Memo.\n1 2\n3 x 4\n");
    try {
        KnetReader::read(stream);
        FAIL() << "Expected KnetException";
    } catch (const KnetException& e) {
        EXPECT_EQ(KnetErrorKind::MalformedSampleValue, e.kind());
        EXPECT_EQ("Line 19, token 2: 'x' is not a number", e.detail());
    }
}

TEST(KnetReaderTest, DecodesHeaderWithRequestedEncoding) {
    DecodeOptions options;
    options.encoding = "ISO-8859-1";
    std::istringstream stream(kHeader + "Memo. caf\xE9\n7\n");
    const auto record = KnetReader::read(stream, options);
    ASSERT_TRUE(record.header.comment.has_value());
    EXPECT_EQ("caf\xC3\xA9", *record.header.comment);
    EXPECT_EQ(1u, record.sample_count);
}

TEST(KnetReaderTest, UndecodableHeaderIsEncodingError) {
    DecodeOptions options;
    options.encoding = "UTF-8";
    EXPECT_EQ(KnetErrorKind::EncodingError, readErrorKind(kHeader + "Memo. \xFF\n", options));
}

TEST(KnetReaderTest, UnknownEncodingIsEncodingError) {
    DecodeOptions options;
    options.encoding = "NOT-A-REAL-ENCODING";
    EXPECT_EQ(KnetErrorKind::EncodingError, readErrorKind(kHeader + "Memo.\n", options));
}

TEST(KnetReaderTest, MissingFileIsIoError) {
    try {
        KnetReader::readFile("/nonexistent/path/file.NS");
        FAIL() << "Expected KnetException";
    } catch (const KnetException& e) {
        EXPECT_EQ(KnetErrorKind::IoError, e.kind());
    }
}
