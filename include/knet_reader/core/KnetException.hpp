// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_CORE_KNET_EXCEPTION_HPP
#define KNET_READER_CORE_KNET_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace knet_reader {

enum class KnetErrorKind {
    EncodingError,
    HeaderLabelMismatch,
    HeaderLineCountMismatch,
    StationNameTooLong,
    MalformedNumericField,
    MalformedCalibrationField,
    MalformedSampleValue,
    PrematureEndOfHeader,
    MalformedTimestampField,
    MissingHeaderField,
    IoError
};

std::string errorKindToString(KnetErrorKind kind);

// Raised for every failure while decoding a K-NET / KiK-net ASCII record.
// what() is prefixed with the kind name, e.g. "HeaderLabelMismatch: ...".
class KnetException : public std::runtime_error {
public:
    KnetException(KnetErrorKind kind, const std::string& message);

    KnetErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    KnetErrorKind kind_;
    std::string detail_;
};

}  // namespace knet_reader

#endif  // KNET_READER_CORE_KNET_EXCEPTION_HPP
