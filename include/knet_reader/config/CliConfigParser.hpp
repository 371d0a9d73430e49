// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_CONFIG_CLI_CONFIG_PARSER_HPP
#define KNET_READER_CONFIG_CLI_CONFIG_PARSER_HPP

#include <optional>
#include <string>
#include <vector>

#include "knet_reader/io/DecodeOptions.hpp"

namespace knet_reader::config {

std::string parseConfigPath(const std::vector<std::string>& args);

struct InfoRequest {
    std::string input_file;
    io::DecodeOptions options;
};

// <file> [--convert-station-name] [--encoding ENC]
InfoRequest parseInfoArguments(const std::vector<std::string>& args);

struct DetectRequest {
    std::vector<std::string> input_files;
    std::optional<std::string> encoding;
};

// <file>... [--encoding ENC]
DetectRequest parseDetectArguments(const std::vector<std::string>& args);

}  // namespace knet_reader::config

#endif  // KNET_READER_CONFIG_CLI_CONFIG_PARSER_HPP
