// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/config/CliConfigParser.hpp"

#include <stdexcept>

namespace knet_reader::config {

std::string parseConfigPath(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::invalid_argument("Expected exactly one configuration path argument");
    }
    if (args.front().empty()) {
        throw std::invalid_argument("Configuration path must not be empty");
    }
    return args.front();
}

InfoRequest parseInfoArguments(const std::vector<std::string>& args) {
    InfoRequest request;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--convert-station-name") {
            request.options.convert_station_name = true;
        } else if (arg == "--encoding") {
            if (i + 1 >= args.size() || args[i + 1].empty()) {
                throw std::invalid_argument("--encoding requires a value");
            }
            request.options.encoding = args[++i];
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (request.input_file.empty()) {
            request.input_file = arg;
        } else {
            throw std::invalid_argument("Expected exactly one input file");
        }
    }
    if (request.input_file.empty()) {
        throw std::invalid_argument("Input file path must not be empty");
    }
    return request;
}

DetectRequest parseDetectArguments(const std::vector<std::string>& args) {
    DetectRequest request;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--encoding") {
            if (i + 1 >= args.size() || args[i + 1].empty()) {
                throw std::invalid_argument("--encoding requires a value");
            }
            request.encoding = args[++i];
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (!arg.empty()) {
            request.input_files.push_back(arg);
        }
    }
    if (request.input_files.empty()) {
        throw std::invalid_argument("Expected at least one file");
    }
    return request;
}

}  // namespace knet_reader::config
