// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_CORE_TIME_SERIES_RECORD_HPP
#define KNET_READER_CORE_TIME_SERIES_RECORD_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "knet_reader/core/UtcTime.hpp"

namespace knet_reader {

// FDSN network code of the NIED strong-motion networks (Bosai-Ken Network).
inline constexpr const char* kNiedNetworkCode = "BO";

// Metadata carried by the 17-line header of a K-NET / KiK-net ASCII file.
// All times are already converted to UTC.
struct HeaderRecord {
    // Event
    UtcTime event_origin_time{};
    double event_latitude = 0.0;
    double event_longitude = 0.0;
    double event_depth_km = 0.0;
    double event_magnitude = 0.0;

    // Station
    std::string station_code;
    std::string location_code;
    double station_latitude = 0.0;
    double station_longitude = 0.0;
    double station_elevation_m = 0.0;

    // Recording
    UtcTime record_start_time{};
    int sampling_rate_hz = 0;
    double duration_s = 0.0;
    std::string channel_code;
    double calibration_factor = 0.0;  // counts -> m/s^2
    double max_acceleration_gal = 0.0;
    UtcTime last_correction_time{};
    std::optional<std::string> comment;

    std::string network_code;
};

struct TimeSeriesRecord {
    HeaderRecord header;
    std::size_t sample_count = 0;
    std::vector<double> samples;

    // Sample interval in seconds, 0 when the sampling rate is unknown.
    double delta() const;

    // Time of the last sample.
    UtcTime endTime() const;

    // NET.STA.LOC.CHA
    std::string streamId() const;
};

}  // namespace knet_reader

#endif  // KNET_READER_CORE_TIME_SERIES_RECORD_HPP
