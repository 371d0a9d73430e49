// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/core/KnetException.hpp"

namespace knet_reader {

std::string errorKindToString(KnetErrorKind kind) {
    switch (kind) {
        case KnetErrorKind::EncodingError:
            return "EncodingError";
        case KnetErrorKind::HeaderLabelMismatch:
            return "HeaderLabelMismatch";
        case KnetErrorKind::HeaderLineCountMismatch:
            return "HeaderLineCountMismatch";
        case KnetErrorKind::StationNameTooLong:
            return "StationNameTooLong";
        case KnetErrorKind::MalformedNumericField:
            return "MalformedNumericField";
        case KnetErrorKind::MalformedCalibrationField:
            return "MalformedCalibrationField";
        case KnetErrorKind::MalformedSampleValue:
            return "MalformedSampleValue";
        case KnetErrorKind::PrematureEndOfHeader:
            return "PrematureEndOfHeader";
        case KnetErrorKind::MalformedTimestampField:
            return "MalformedTimestampField";
        case KnetErrorKind::MissingHeaderField:
            return "MissingHeaderField";
        case KnetErrorKind::IoError:
        default:
            return "IoError";
    }
}

KnetException::KnetException(KnetErrorKind kind, const std::string& message)
    : std::runtime_error(errorKindToString(kind) + ": " + message),
      kind_(kind),
      detail_(message) {}

}  // namespace knet_reader
