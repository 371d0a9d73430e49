// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_DECODE_OPTIONS_HPP
#define KNET_READER_IO_DECODE_OPTIONS_HPP

#include <optional>
#include <string>

namespace knet_reader::io {

struct DecodeOptions {
    // Text encoding of the file; the platform preferred encoding when unset.
    std::optional<std::string> encoding;

    // Move the last two characters of station codes longer than five
    // characters into the location code (keeps miniSEED station names short).
    bool convert_station_name = false;
};

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_DECODE_OPTIONS_HPP
