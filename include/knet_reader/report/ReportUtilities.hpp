// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_REPORT_REPORT_UTILITIES_HPP
#define KNET_READER_REPORT_REPORT_UTILITIES_HPP

#include <string>

#include "knet_reader/core/TimeSeriesRecord.hpp"

namespace knet_reader {

std::string formatRecordSummary(const TimeSeriesRecord& record);

// One line per header field, as printed by `knet_tool info`.
std::string formatHeaderDetails(const HeaderRecord& header);

}  // namespace knet_reader

#endif  // KNET_READER_REPORT_REPORT_UTILITIES_HPP
