// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_FIELD_PARSERS_HPP
#define KNET_READER_IO_FIELD_PARSERS_HPP

#include <string>
#include <vector>

namespace knet_reader::io {

struct StationName {
    std::string station;
    std::string location;
};

// Splits on runs of ASCII whitespace, dropping empty tokens.
std::vector<std::string> splitWhitespace(const std::string& line);

// The run of decimal digits at the very start of token ("100Hz" -> "100").
std::string leadingDigits(const std::string& token);

// Strict number parsing in the classic "C" locale; the whole token must be
// consumed.
bool parseDouble(const std::string& token, double& value);
bool parseInt(const std::string& token, int& value);

// Removes '-' and surrounding whitespace, then maps the KiK-net borehole
// codes 1..6 to NS1, EW1, UD1, NS2, EW2, UD2. Anything else passes through.
std::string remapChannel(const std::string& direction);

// Station codes longer than 5 characters lose their last two characters to
// the location code when convert is set. Throws
// KnetException(StationNameTooLong) if the station is longer than 7.
StationName splitStationCode(const std::string& raw, bool convert);

// "<num>/<denom>" -> 0.01 * num / denom (gal -> m/s^2). Only the leading
// digits of the numerator count, so "3920(gal)/6182761" is accepted. Throws
// KnetException(MalformedCalibrationField).
double computeCalibrationFactor(const std::string& scale_factor);

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_FIELD_PARSERS_HPP
