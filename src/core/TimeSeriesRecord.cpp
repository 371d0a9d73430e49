// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/core/TimeSeriesRecord.hpp"

#include <cmath>

namespace knet_reader {

double TimeSeriesRecord::delta() const {
    if (header.sampling_rate_hz <= 0) {
        return 0.0;
    }
    return 1.0 / static_cast<double>(header.sampling_rate_hz);
}

UtcTime TimeSeriesRecord::endTime() const {
    if (sample_count == 0) {
        return header.record_start_time;
    }
    const double span_s = static_cast<double>(sample_count - 1) * delta();
    const auto span = std::chrono::milliseconds(static_cast<int64_t>(std::llround(span_s * 1000.0)));
    return header.record_start_time + span;
}

std::string TimeSeriesRecord::streamId() const {
    return header.network_code + "." + header.station_code + "." +
           header.location_code + "." + header.channel_code;
}

}  // namespace knet_reader
