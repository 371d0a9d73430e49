// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_KNET_HEADER_PARSER_HPP
#define KNET_READER_IO_KNET_HEADER_PARSER_HPP

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "knet_reader/core/TimeSeriesRecord.hpp"
#include "knet_reader/core/UtcTime.hpp"
#include "knet_reader/io/DecodeOptions.hpp"

namespace knet_reader::io {

inline constexpr std::size_t kHeaderLineCount = 17;

// Tokens of one header line, with accessors that raise KnetException carrying
// the line label on failure.
class HeaderFields {
public:
    HeaderFields(std::string label, std::string line);

    const std::string& label() const { return label_; }
    const std::string& line() const { return line_; }
    const std::vector<std::string>& tokens() const { return tokens_; }
    std::size_t size() const { return tokens_.size(); }

    // MissingHeaderField when index is out of range.
    const std::string& at(std::size_t index) const;

    // MalformedNumericField unless the whole token is a number.
    double number(std::size_t index) const;

    // Leading digit run of the token ("100Hz" -> 100). MalformedNumericField
    // when the token does not start with a digit.
    int integerPrefix(std::size_t index) const;

    // Tokens 2 and 3 as "YYYY/MM/DD HH:MM:SS", still in local time.
    // MalformedTimestampField when they do not form a valid timestamp.
    UtcTime localTimestamp() const;

private:
    std::string label_;
    std::string line_;
    std::vector<std::string> tokens_;
};

using HeaderFieldRule = void (*)(const HeaderFields& fields,
                                 const DecodeOptions& options,
                                 HeaderRecord& header);

struct HeaderLineDescriptor {
    const char* label;
    HeaderFieldRule apply;
};

// The fixed, ordered layout of the K-NET / KiK-net header block.
const std::array<HeaderLineDescriptor, kHeaderLineCount>& headerLayout();

// Parses the collected header block. Every line must start with the label at
// its position and there must be exactly kHeaderLineCount lines.
HeaderRecord parseHeader(const std::vector<std::string>& lines, const DecodeOptions& options = {});

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_KNET_HEADER_PARSER_HPP
