// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_HDF5_WRITERS_HPP
#define KNET_READER_IO_HDF5_WRITERS_HPP

#include <string>

#include "knet_reader/core/TimeSeriesRecord.hpp"

namespace knet_reader::io {

// <output_dir>/<NET.STA.LOC.CHA>.<start YYYYMMDDTHHMMSS>.h5, so records of one
// channel from different events never share an archive.
std::string archivePathFor(const std::string& output_dir, const TimeSeriesRecord& record);

// Appends "HDF5 write failed: ..." to error_message on failure.
bool writeRecordArchive(const std::string& output_path,
                        const TimeSeriesRecord& record,
                        std::string& error_message);

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_HDF5_WRITERS_HPP
