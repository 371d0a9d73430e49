// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/io/Hdf5Writers.hpp"

#include <cstdio>
#include <filesystem>

#include "knet_reader/io/HDF5IO.hpp"

namespace knet_reader::io {

namespace {

// 20120101T052815, with a ".mmm" suffix only for sub-second start times
std::string compactTimestamp(UtcTime time) {
    const CivilTime civil = toCivilTime(time);
    char buffer[32];
    if (civil.millisecond != 0) {
        std::snprintf(buffer, sizeof(buffer), "%04d%02d%02dT%02d%02d%02d.%03d",
                      civil.year, civil.month, civil.day,
                      civil.hour, civil.minute, civil.second, civil.millisecond);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%04d%02d%02dT%02d%02d%02d",
                      civil.year, civil.month, civil.day,
                      civil.hour, civil.minute, civil.second);
    }
    return buffer;
}

}  // namespace

std::string archivePathFor(const std::string& output_dir, const TimeSeriesRecord& record) {
    const std::string name =
        record.streamId() + "." + compactTimestamp(record.header.record_start_time) + ".h5";
    return (std::filesystem::path(output_dir) / name).string();
}

bool writeRecordArchive(const std::string& output_path,
                        const TimeSeriesRecord& record,
                        std::string& error_message) {
    if (output_path.empty()) {
        return false;
    }

    HDF5IO hdf5_io;
    if (!hdf5_io.write(output_path, record)) {
        if (!error_message.empty()) {
            error_message.append("; ");
        }
        error_message.append("HDF5 write failed: ");
        error_message.append(hdf5_io.getLastError());
        return false;
    }
    return true;
}

}  // namespace knet_reader::io
