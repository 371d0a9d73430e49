// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <hdf5.h>
#include <hdf5_hl.h>

#include "knet_reader/core/TimeSeriesRecord.hpp"

namespace knet_reader {

// Archive layout:
//   /metadata   string attributes (ids, ISO-8601 times, comment)
//   /event      origin_time_ms, latitude, longitude, depth_km, magnitude
//   /station    latitude, longitude, elevation_m
//   /recording  start_time_ms, sampling_rate_hz, duration_s,
//               calibration_factor, max_acceleration_gal, last_correction_time_ms
//   /waveform   samples[sample_count], sample_count
class HDF5IO {
public:
    HDF5IO() = default;
    ~HDF5IO() = default;

    bool write(const std::string& filename, const TimeSeriesRecord& record);

    bool read(const std::string& filename, TimeSeriesRecord& record);

    bool isValidHDF5(const std::string& filename) const;

    std::string getLastError() const { return last_error_; }

    static constexpr const char* kFormatVersion = "1.0.0";

private:
    std::string last_error_;

    bool writeMetadata(hid_t file_id, const TimeSeriesRecord& record);
    bool writeEvent(hid_t file_id, const HeaderRecord& header);
    bool writeStation(hid_t file_id, const HeaderRecord& header);
    bool writeRecording(hid_t file_id, const HeaderRecord& header);
    bool writeWaveform(hid_t file_id, const TimeSeriesRecord& record);

    bool readMetadata(hid_t file_id, TimeSeriesRecord& record);
    bool readEvent(hid_t file_id, HeaderRecord& header);
    bool readStation(hid_t file_id, HeaderRecord& header);
    bool readRecording(hid_t file_id, HeaderRecord& header);
    bool readWaveform(hid_t file_id, TimeSeriesRecord& record);

    bool createGroup(hid_t file_id, const std::string& group_name);
    bool writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value);
    bool readStringAttribute(hid_t loc_id, const std::string& name, std::string& value);
    bool writeScalar(hid_t group_id, const std::string& name, hid_t type, const void* value);
    bool readScalar(hid_t group_id, const std::string& name, hid_t type, void* value);
};

}  // namespace knet_reader
