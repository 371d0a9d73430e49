// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/report/ReportUtilities.hpp"

#include <iomanip>
#include <sstream>

namespace knet_reader {

std::string formatRecordSummary(const TimeSeriesRecord& record) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "Record summary:\n";
    oss << "  Stream id        : " << record.streamId() << "\n";
    oss << "  Start time       : " << formatIso8601(record.header.record_start_time) << "\n";
    oss << "  End time         : " << formatIso8601(record.endTime()) << "\n";
    oss << "  Sampling rate    : " << record.header.sampling_rate_hz << " Hz\n";
    oss << "  Sample count     : " << record.sample_count << "\n";
    oss << "  Calibration      : " << std::setprecision(10) << record.header.calibration_factor;
    return oss.str();
}

std::string formatHeaderDetails(const HeaderRecord& header) {
    std::ostringstream oss;
    oss << "Event:\n";
    oss << "  Origin time      : " << formatIso8601(header.event_origin_time) << "\n";
    oss << "  Latitude         : " << header.event_latitude << "\n";
    oss << "  Longitude        : " << header.event_longitude << "\n";
    oss << "  Depth (km)       : " << header.event_depth_km << "\n";
    oss << "  Magnitude        : " << header.event_magnitude << "\n";
    oss << "Station:\n";
    oss << "  Network          : " << header.network_code << "\n";
    oss << "  Station          : " << header.station_code << "\n";
    oss << "  Location         : " << header.location_code << "\n";
    oss << "  Latitude         : " << header.station_latitude << "\n";
    oss << "  Longitude        : " << header.station_longitude << "\n";
    oss << "  Elevation (m)    : " << header.station_elevation_m << "\n";
    oss << "Recording:\n";
    oss << "  Channel          : " << header.channel_code << "\n";
    oss << "  Duration (s)     : " << header.duration_s << "\n";
    oss << "  Max. acc. (gal)  : " << header.max_acceleration_gal << "\n";
    oss << "  Last correction  : " << formatIso8601(header.last_correction_time);
    if (header.comment) {
        oss << "\n  Comment          : " << *header.comment;
    }
    return oss.str();
}

}  // namespace knet_reader
