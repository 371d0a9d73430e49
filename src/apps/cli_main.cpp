// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/config/CliConfigParser.hpp"
#include "knet_reader/config/ConverterConfig.hpp"
#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/FileFormatDetector.hpp"
#include "knet_reader/io/KnetReader.hpp"
#include "knet_reader/report/ReportUtilities.hpp"
#include "knet_reader/services/ConversionExecutor.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

using knet_reader::config::ConverterConfig;
using knet_reader::config::DetectRequest;
using knet_reader::config::InfoRequest;
using knet_reader::config::loadConverterConfigFromYaml;
using knet_reader::config::parseConfigPath;
using knet_reader::config::parseDetectArguments;
using knet_reader::config::parseInfoArguments;
using knet_reader::io::FileFormatDetector;
using knet_reader::io::KnetReader;
using knet_reader::services::ConversionResult;
using knet_reader::services::runConversion;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  detect <file>... [--encoding ENC]         - Report whether each file is K-NET ASCII\n";
    std::cout << "  info <file> [--convert-station-name] [--encoding ENC]\n";
    std::cout << "                                            - Decode one file and print its header\n";
    std::cout << "  convert <config.yaml>                     - Convert files using YAML configuration\n";
}

int runDetect(const std::vector<std::string>& args, const char* program_name) {
    DetectRequest request;
    try {
        request = parseDetectArguments(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(program_name);
        return 1;
    }

    // Content only: an extension match says nothing about whether the file decodes
    bool all_known = true;
    for (const auto& file : request.input_files) {
        const auto format = FileFormatDetector::detectByContent(file, request.encoding);
        all_known = all_known && FileFormatDetector::isSupportedFormat(format);
        std::cout << file << ": " << FileFormatDetector::formatToString(format) << "\n";
    }
    return all_known ? 0 : 2;
}

int runInfo(const std::vector<std::string>& args, const char* program_name) {
    InfoRequest request;
    try {
        request = parseInfoArguments(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(program_name);
        return 1;
    }

    try {
        const auto record = KnetReader::readFile(request.input_file, request.options);
        std::cout << knet_reader::formatRecordSummary(record) << "\n";
        std::cout << knet_reader::formatHeaderDetails(record.header) << "\n";
    } catch (const knet_reader::KnetException& e) {
        std::cerr << "Decode failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int runConvert(const std::vector<std::string>& args, const char* program_name) {
    std::string config_path;
    try {
        config_path = parseConfigPath(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(program_name);
        return 1;
    }

    ConverterConfig config;
    try {
        config = loadConverterConfigFromYaml(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        for (const auto& err : errors) {
            std::cerr << "Config error: " << err << "\n";
        }
        return 1;
    }

    std::string conversion_error;
    const std::size_t converted = runConversion(
        config,
        [&](const ConversionResult& result) {
            if (config.print_summary) {
                std::cout << knet_reader::formatRecordSummary(result.record) << "\n";
            }
            if (!result.output_file.empty()) {
                std::cout << "  Output archive   : " << result.output_file << "\n";
            } else {
                std::cout << "Decoding successful. No archive was saved (save_hdf5=false).\n";
            }
        },
        &conversion_error);

    if (!conversion_error.empty()) {
        std::cerr << "Conversion failed: " << conversion_error << "\n";
    }

    std::cout << "Converted " << converted << " of " << config.input_files.size() << " files\n";
    return converted == config.input_files.size() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "detect") {
            return runDetect(args, argv[0]);
        } else if (command == "info") {
            return runInfo(args, argv[0]);
        } else if (command == "convert") {
            return runConvert(args, argv[0]);
        } else {
            std::cerr << "Error: Unknown command '" << command << "'\n";
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
