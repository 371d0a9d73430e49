// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/io/KnetHeaderParser.hpp"

#include <utility>

#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/FieldParsers.hpp"

namespace knet_reader::io {

namespace {

const std::array<HeaderLineDescriptor, kHeaderLineCount> kHeaderLayout = {{
    // Event
    {"Origin Time",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.event_origin_time = jstToUtc(f.localTimestamp());
     }},
    {"Lat.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.event_latitude = f.number(1);
     }},
    {"Long.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.event_longitude = f.number(1);
     }},
    {"Depth. (km)",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.event_depth_km = f.number(2);
     }},
    {"Mag.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.event_magnitude = f.number(1);
     }},

    // Station
    {"Station Code",
     [](const HeaderFields& f, const DecodeOptions& options, HeaderRecord& h) {
         StationName name = splitStationCode(f.at(2), options.convert_station_name);
         h.station_code = std::move(name.station);
         h.location_code = std::move(name.location);
     }},
    {"Station Lat.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.station_latitude = f.number(2);
     }},
    {"Station Long.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.station_longitude = f.number(2);
     }},
    {"Station Height(m)",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.station_elevation_m = f.number(2);
     }},

    // Recording
    {"Record Time",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.record_start_time = jstToUtc(removeTriggerDelay(f.localTimestamp()));
     }},
    {"Sampling Freq(Hz)",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.sampling_rate_hz = f.integerPrefix(2);
     }},
    {"Duration Time(s)",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.duration_s = f.number(2);
     }},
    {"Dir.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.channel_code = remapChannel(f.at(1));
     }},
    {"Scale Factor",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.calibration_factor = computeCalibrationFactor(f.at(2));
     }},
    {"Max. Acc. (gal)",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.max_acceleration_gal = f.number(3);
     }},
    {"Last Correction",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         h.last_correction_time = jstToUtc(f.localTimestamp());
     }},

    // Optional free-text comment
    {"Memo.",
     [](const HeaderFields& f, const DecodeOptions&, HeaderRecord& h) {
         if (f.size() <= 1) {
             return;
         }
         std::string comment = f.tokens()[1];
         for (std::size_t i = 2; i < f.size(); ++i) {
             comment += ' ';
             comment += f.tokens()[i];
         }
         h.comment = std::move(comment);
     }},
}};

}  // namespace

HeaderFields::HeaderFields(std::string label, std::string line)
    : label_(std::move(label)), line_(std::move(line)), tokens_(splitWhitespace(line_)) {}

const std::string& HeaderFields::at(std::size_t index) const {
    if (index >= tokens_.size()) {
        throw KnetException(KnetErrorKind::MissingHeaderField,
                            "'" + label_ + "' line has no field " + std::to_string(index) +
                                ": '" + line_ + "'");
    }
    return tokens_[index];
}

double HeaderFields::number(std::size_t index) const {
    const std::string& token = at(index);
    double value = 0.0;
    if (!parseDouble(token, value)) {
        throw KnetException(KnetErrorKind::MalformedNumericField,
                            "'" + label_ + "' value is not a number: '" + token + "'");
    }
    return value;
}

int HeaderFields::integerPrefix(std::size_t index) const {
    const std::string& token = at(index);
    int value = 0;
    if (!parseInt(leadingDigits(token), value)) {
        throw KnetException(KnetErrorKind::MalformedNumericField,
                            "'" + label_ + "' value has no leading integer: '" + token + "'");
    }
    return value;
}

UtcTime HeaderFields::localTimestamp() const {
    const std::string text = at(2) + " " + at(3);
    const auto civil = parseCalendarTimestamp(text);
    if (!civil) {
        throw KnetException(KnetErrorKind::MalformedTimestampField,
                            "'" + label_ + "' is not a YYYY/MM/DD HH:MM:SS timestamp: '" + text + "'");
    }
    return toUtcTime(*civil);
}

const std::array<HeaderLineDescriptor, kHeaderLineCount>& headerLayout() {
    return kHeaderLayout;
}

HeaderRecord parseHeader(const std::vector<std::string>& lines, const DecodeOptions& options) {
    HeaderRecord header;
    for (std::size_t i = 0; i < kHeaderLayout.size(); ++i) {
        const HeaderLineDescriptor& descriptor = kHeaderLayout[i];
        if (i >= lines.size()) {
            throw KnetException(KnetErrorKind::PrematureEndOfHeader,
                                "Header ended after " + std::to_string(lines.size()) +
                                    " lines; expected a line starting with '" + descriptor.label + "'");
        }

        const std::string& line = lines[i];
        if (line.compare(0, std::char_traits<char>::length(descriptor.label), descriptor.label) != 0) {
            throw KnetException(KnetErrorKind::HeaderLabelMismatch,
                                "Expected line to start with '" + std::string(descriptor.label) +
                                    "' but got '" + line + "'");
        }

        descriptor.apply(HeaderFields(descriptor.label, line), options, header);
    }

    if (lines.size() != kHeaderLineCount) {
        throw KnetException(KnetErrorKind::HeaderLineCountMismatch,
                            "Expected " + std::to_string(kHeaderLineCount) + " header lines but got " +
                                std::to_string(lines.size()));
    }
    return header;
}

}  // namespace knet_reader::io
