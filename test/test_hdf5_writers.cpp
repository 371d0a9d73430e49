// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "knet_reader/io/HDF5IO.hpp"
#include "knet_reader/io/Hdf5Writers.hpp"
#include "knet_reader/io/KnetReader.hpp"

using namespace knet_reader;

TEST(Hdf5WritersTest, ArchivePathUsesStreamId) {
    TimeSeriesRecord record;
    record.header.network_code = "BO";
    record.header.station_code = "IWTH";
    record.header.location_code = "27";
    record.header.channel_code = "UD1";
    record.header.record_start_time = toUtcTime(*parseCalendarTimestamp("2011/03/11 05:46:30"));
    EXPECT_EQ("/tmp/out/BO.IWTH.27.UD1.20110311T054630.h5", io::archivePathFor("/tmp/out", record));

    record.header.record_start_time += std::chrono::milliseconds(250);
    EXPECT_EQ("/tmp/out/BO.IWTH.27.UD1.20110311T054630.250.h5", io::archivePathFor("/tmp/out", record));
}

TEST(Hdf5WritersTest, ArchivePathDiffersPerEvent) {
    TimeSeriesRecord first;
    first.header.network_code = "BO";
    first.header.station_code = "AKT013";
    first.header.channel_code = "NS";
    first.header.record_start_time = toUtcTime(*parseCalendarTimestamp("2012/01/01 05:28:15"));

    TimeSeriesRecord second = first;
    second.header.record_start_time = toUtcTime(*parseCalendarTimestamp("2013/01/01 05:28:15"));

    EXPECT_NE(io::archivePathFor("/tmp/out", first), io::archivePathFor("/tmp/out", second));
}

TEST(Hdf5WritersTest, WritesRecordArchive) {
    const auto record = io::KnetReader::readFile(std::string(TEST_DATA_DIR) + "/AKT0131201011427.NS");
    const auto output = io::archivePathFor(std::filesystem::temp_directory_path().string(), record);
    std::filesystem::remove(output);

    std::string error;
    ASSERT_TRUE(io::writeRecordArchive(output, record, error)) << error;
    EXPECT_TRUE(error.empty());

    HDF5IO hdf5_io;
    EXPECT_TRUE(hdf5_io.isValidHDF5(output));
    std::filesystem::remove(output);
}

TEST(Hdf5WritersTest, AppendsFailureToErrorMessage) {
    TimeSeriesRecord record;
    std::string error = "earlier problem";
    EXPECT_FALSE(io::writeRecordArchive("/nonexistent/dir/out.h5", record, error));
    EXPECT_EQ(0u, error.find("earlier problem; HDF5 write failed: "));
}

TEST(Hdf5WritersTest, FailureMessageNamesCause) {
    TimeSeriesRecord record;
    record.header.comment = std::string(128 * 1024, 'x');
    const auto output = (std::filesystem::temp_directory_path() / "knet_reader_oversized_comment.h5").string();

    std::string error;
    EXPECT_FALSE(io::writeRecordArchive(output, record, error));
    const std::string prefix = "HDF5 write failed: ";
    ASSERT_EQ(0u, error.find(prefix));
    EXPECT_GT(error.size(), prefix.size());
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(Hdf5WritersTest, EmptyPathIsRejected) {
    TimeSeriesRecord record;
    std::string error;
    EXPECT_FALSE(io::writeRecordArchive("", record, error));
}
