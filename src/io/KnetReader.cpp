// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/io/KnetReader.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <utility>

#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/FieldParsers.hpp"
#include "knet_reader/io/KnetHeaderParser.hpp"

namespace knet_reader::io {

namespace {

constexpr const char* kHeaderTerminator = "Memo";

void stripLineTerminator(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

HeaderBlock KnetReader::collectHeaderLines(std::istream& stream, TextDecoder& decoder) {
    HeaderBlock block;
    std::string raw;
    while (std::getline(stream, raw)) {
        stripLineTerminator(raw);
        block.lines.push_back(decoder.decode(raw));
        if (block.lines.back().rfind(kHeaderTerminator, 0) == 0) {
            block.terminated = true;
            break;
        }
    }
    return block;
}

std::vector<double> KnetReader::parseSamples(std::istream& stream, std::size_t first_line_number) {
    std::vector<double> samples;
    std::string line;
    std::size_t line_number = first_line_number;
    for (; std::getline(stream, line); ++line_number) {
        const auto tokens = splitWhitespace(line);
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            double value = 0.0;
            if (!parseDouble(tokens[i], value)) {
                throw KnetException(KnetErrorKind::MalformedSampleValue,
                                    "Line " + std::to_string(line_number) + ", token " +
                                        std::to_string(i + 1) + ": '" + tokens[i] + "' is not a number");
            }
            samples.push_back(value);
        }
    }
    return samples;
}

TimeSeriesRecord KnetReader::read(std::istream& stream, const DecodeOptions& options) {
    TextDecoder decoder(options.encoding.value_or(TextDecoder::preferredEncoding()));

    HeaderBlock block = collectHeaderLines(stream, decoder);
    if (!block.terminated) {
        throw KnetException(KnetErrorKind::PrematureEndOfHeader,
                            "Stream ended after " + std::to_string(block.lines.size()) +
                                " header lines without a 'Memo.' line");
    }

    TimeSeriesRecord record;
    record.header = parseHeader(block.lines, options);
    record.samples = parseSamples(stream, block.lines.size() + 1);
    record.sample_count = record.samples.size();
    record.header.network_code = kNiedNetworkCode;
    return record;
}

TimeSeriesRecord KnetReader::readFile(const std::string& filename, const DecodeOptions& options) {
    auto t0 = std::chrono::high_resolution_clock::now();

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw KnetException(KnetErrorKind::IoError, "Cannot open file: " + filename);
    }

    TimeSeriesRecord record = read(file, options);

    auto t1 = std::chrono::high_resolution_clock::now();
    double total_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][KnetReader] file='" << filename << "' total=" << total_ms
              << " ms, samples=" << record.sample_count << std::endl;
    return record;
}

}  // namespace knet_reader::io
