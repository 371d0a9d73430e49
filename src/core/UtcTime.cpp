// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/core/UtcTime.hpp"

#include <cctype>
#include <cstdio>

namespace knet_reader {

namespace {

constexpr int64_t kMillisPerDay = 86'400'000;

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

class TimestampCursor {
public:
    explicit TimestampCursor(const std::string& text) : text_(text) {}

    bool readNumber(std::size_t min_digits, std::size_t max_digits, int& value) {
        std::size_t digits = 0;
        value = 0;
        while (pos_ < text_.size() && digits < max_digits &&
               std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            value = value * 10 + (text_[pos_] - '0');
            ++pos_;
            ++digits;
        }
        return digits >= min_digits;
    }

    bool expect(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool atEnd() const { return pos_ == text_.size(); }

private:
    const std::string& text_;
    std::size_t pos_ = 0;
};

}  // namespace

int64_t daysFromCivil(int year, int month, int day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

bool isValidCivilTime(const CivilTime& civil) {
    if (civil.month < 1 || civil.month > 12) {
        return false;
    }
    if (civil.day < 1 || civil.day > daysInMonth(civil.year, civil.month)) {
        return false;
    }
    return civil.hour >= 0 && civil.hour <= 23 &&
           civil.minute >= 0 && civil.minute <= 59 &&
           civil.second >= 0 && civil.second <= 59 &&
           civil.millisecond >= 0 && civil.millisecond <= 999;
}

UtcTime toUtcTime(const CivilTime& civil) {
    const int64_t days = daysFromCivil(civil.year, civil.month, civil.day);
    const int64_t millis = days * kMillisPerDay +
                           (static_cast<int64_t>(civil.hour) * 3600 +
                            static_cast<int64_t>(civil.minute) * 60 + civil.second) * 1000 +
                           civil.millisecond;
    return fromEpochMilliseconds(millis);
}

CivilTime toCivilTime(UtcTime time) {
    const int64_t millis = toEpochMilliseconds(time);
    int64_t days = millis / kMillisPerDay;
    int64_t rem = millis % kMillisPerDay;
    if (rem < 0) {
        rem += kMillisPerDay;
        --days;
    }

    CivilTime civil;
    civilFromDays(days, civil.year, civil.month, civil.day);
    civil.hour = static_cast<int>(rem / 3'600'000);
    civil.minute = static_cast<int>((rem / 60'000) % 60);
    civil.second = static_cast<int>((rem / 1000) % 60);
    civil.millisecond = static_cast<int>(rem % 1000);
    return civil;
}

std::optional<CivilTime> parseCalendarTimestamp(const std::string& text) {
    TimestampCursor cursor(text);
    CivilTime civil;
    const bool parsed = cursor.readNumber(4, 4, civil.year) && cursor.expect('/') &&
                        cursor.readNumber(1, 2, civil.month) && cursor.expect('/') &&
                        cursor.readNumber(1, 2, civil.day) && cursor.expect(' ') &&
                        cursor.readNumber(1, 2, civil.hour) && cursor.expect(':') &&
                        cursor.readNumber(1, 2, civil.minute) && cursor.expect(':') &&
                        cursor.readNumber(1, 2, civil.second) && cursor.atEnd();
    if (!parsed || !isValidCivilTime(civil)) {
        return std::nullopt;
    }
    return civil;
}

UtcTime jstToUtc(UtcTime local) {
    return local - kJstOffset;
}

UtcTime removeTriggerDelay(UtcTime local) {
    return local - kLoggerTriggerDelay;
}

std::string formatIso8601(UtcTime time) {
    const CivilTime civil = toCivilTime(time);
    char buffer[40];
    if (civil.millisecond != 0) {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      civil.year, civil.month, civil.day,
                      civil.hour, civil.minute, civil.second, civil.millisecond);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                      civil.year, civil.month, civil.day,
                      civil.hour, civil.minute, civil.second);
    }
    return buffer;
}

int64_t toEpochMilliseconds(UtcTime time) {
    return time.time_since_epoch().count();
}

UtcTime fromEpochMilliseconds(int64_t millis) {
    return UtcTime(std::chrono::milliseconds(millis));
}

}  // namespace knet_reader
