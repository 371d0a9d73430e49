// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_KNET_READER_HPP
#define KNET_READER_IO_KNET_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "knet_reader/core/TimeSeriesRecord.hpp"
#include "knet_reader/io/DecodeOptions.hpp"
#include "knet_reader/io/TextDecoder.hpp"

namespace knet_reader::io {

// Raw header lines (terminators stripped) read up to and including the first
// line starting with "Memo".
struct HeaderBlock {
    std::vector<std::string> lines;
    bool terminated = false;  // false when the stream ended before "Memo"
};

// K-NET / KiK-net ASCII reader. All failures are reported as KnetException.
class KnetReader {
public:
    // Decodes a whole record from the stream's current position.
    static TimeSeriesRecord read(std::istream& stream, const DecodeOptions& options = {});

    // Opens filename in binary mode and decodes it (IoError if it cannot be
    // opened).
    static TimeSeriesRecord readFile(const std::string& filename, const DecodeOptions& options = {});

    static HeaderBlock collectHeaderLines(std::istream& stream, TextDecoder& decoder);

    // Reads every remaining line; first_line_number is the 1-based file line
    // number of the first line read, used in diagnostics.
    static std::vector<double> parseSamples(std::istream& stream, std::size_t first_line_number);
};

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_KNET_READER_HPP
