// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/io/FieldParsers.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <locale>
#include <sstream>
#include <utility>

#include "knet_reader/core/KnetException.hpp"

namespace knet_reader::io {

namespace {

constexpr std::size_t kMaxStationLength = 7;
constexpr std::size_t kConvertibleStationLength = 5;
constexpr double kGalToMetersPerSecondSquared = 0.01;

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

template <typename T>
bool parseNumber(const std::string& token, T& value) {
    if (token.empty() || isSpace(token.front())) {
        return false;
    }
    std::istringstream iss(token);
    iss.imbue(std::locale::classic());
    T parsed{};
    if (!(iss >> parsed)) {
        return false;
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return false;
    }
    value = parsed;
    return true;
}

}  // namespace

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && isSpace(line[pos])) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < line.size() && !isSpace(line[pos])) {
            ++pos;
        }
        if (pos > start) {
            tokens.emplace_back(line.substr(start, pos - start));
        }
    }
    return tokens;
}

std::string leadingDigits(const std::string& token) {
    const auto end = std::find_if(token.begin(), token.end(), [](char c) {
        return !std::isdigit(static_cast<unsigned char>(c));
    });
    return std::string(token.begin(), end);
}

bool parseDouble(const std::string& token, double& value) {
    return parseNumber(token, value);
}

bool parseInt(const std::string& token, int& value) {
    return parseNumber(token, value);
}

std::string remapChannel(const std::string& direction) {
    static const std::array<std::pair<const char*, const char*>, 6> kKiknetComponents = {{
        {"1", "NS1"}, {"2", "EW1"}, {"3", "UD1"},
        {"4", "NS2"}, {"5", "EW2"}, {"6", "UD2"},
    }};

    std::string channel;
    channel.reserve(direction.size());
    std::copy_if(direction.begin(), direction.end(), std::back_inserter(channel),
                 [](char c) { return c != '-'; });

    const auto first = std::find_if_not(channel.begin(), channel.end(), isSpace);
    const auto last = std::find_if_not(channel.rbegin(), channel.rend(), isSpace).base();
    channel = (first < last) ? std::string(first, last) : std::string();

    for (const auto& entry : kKiknetComponents) {
        if (channel == entry.first) {
            return entry.second;
        }
    }
    return channel;
}

StationName splitStationCode(const std::string& raw, bool convert) {
    StationName name;
    name.station = raw;
    if (convert && raw.size() > kConvertibleStationLength) {
        name.location = raw.substr(raw.size() - 2);
        name.station = raw.substr(0, raw.size() - 2);
    }
    if (name.station.size() > kMaxStationLength) {
        throw KnetException(KnetErrorKind::StationNameTooLong,
                            "Station name can't be more than 7 characters long: '" + name.station + "'");
    }
    return name;
}

double computeCalibrationFactor(const std::string& scale_factor) {
    const auto slash = scale_factor.find('/');
    if (slash == std::string::npos || scale_factor.find('/', slash + 1) != std::string::npos) {
        throw KnetException(KnetErrorKind::MalformedCalibrationField,
                            "Expected '<numerator>/<denominator>' but got '" + scale_factor + "'");
    }

    const std::string numerator_text = leadingDigits(scale_factor.substr(0, slash));
    const std::string denominator_text = scale_factor.substr(slash + 1);

    double numerator = 0.0;
    double denominator = 0.0;
    if (!parseDouble(numerator_text, numerator)) {
        throw KnetException(KnetErrorKind::MalformedCalibrationField,
                            "Scale factor numerator is not numeric in '" + scale_factor + "'");
    }
    if (!parseDouble(denominator_text, denominator)) {
        throw KnetException(KnetErrorKind::MalformedCalibrationField,
                            "Scale factor denominator is not numeric in '" + scale_factor + "'");
    }
    if (denominator == 0.0) {
        throw KnetException(KnetErrorKind::MalformedCalibrationField,
                            "Scale factor denominator is zero in '" + scale_factor + "'");
    }
    return kGalToMetersPerSecondSquared * numerator / denominator;
}

}  // namespace knet_reader::io
