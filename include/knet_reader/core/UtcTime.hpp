// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_CORE_UTC_TIME_HPP
#define KNET_READER_CORE_UTC_TIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace knet_reader {

// Absolute time on the UTC axis, millisecond resolution, no leap seconds.
using UtcTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Broken-down calendar time (proleptic Gregorian).
struct CivilTime {
    int year = 1970;
    int month = 1;   // 1-12
    int day = 1;     // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
};

// All K-NET / KiK-net timestamps are recorded in Japan Standard Time (UTC+9).
constexpr std::chrono::seconds kJstOffset{9 * 3600};

// Delay the K-NET / KiK-net data logger adds to the nominal record time.
constexpr std::chrono::seconds kLoggerTriggerDelay{15};

// Days since 1970-01-01 for a civil date (valid for any Gregorian date).
int64_t daysFromCivil(int year, int month, int day);

// Inverse of daysFromCivil.
void civilFromDays(int64_t days, int& year, int& month, int& day);

bool isValidCivilTime(const CivilTime& civil);

UtcTime toUtcTime(const CivilTime& civil);
CivilTime toCivilTime(UtcTime time);

// Parses "YYYY/MM/DD HH:MM:SS". Month, day, hour, minute and second may have
// one or two digits, the year exactly four. No locale or time zone involved.
std::optional<CivilTime> parseCalendarTimestamp(const std::string& text);

// Local JST wall-clock time to UTC.
UtcTime jstToUtc(UtcTime local);

// Nominal record time to actual first-sample time, still in local time.
UtcTime removeTriggerDelay(UtcTime local);

// ISO-8601 with a trailing 'Z'; milliseconds are printed only when non-zero.
std::string formatIso8601(UtcTime time);

// Milliseconds since the Unix epoch.
int64_t toEpochMilliseconds(UtcTime time);
UtcTime fromEpochMilliseconds(int64_t millis);

}  // namespace knet_reader

#endif  // KNET_READER_CORE_UTC_TIME_HPP
