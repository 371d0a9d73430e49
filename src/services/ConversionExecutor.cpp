// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/services/ConversionExecutor.hpp"

#include <utility>

#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/FileFormatDetector.hpp"
#include "knet_reader/io/Hdf5Writers.hpp"
#include "knet_reader/io/KnetReader.hpp"
#include "knet_reader/utils/ErrorAccumulator.hpp"

namespace knet_reader::services {

ConversionExecutor::ConversionExecutor(config::ConverterConfig config)
    : config_(std::move(config)) {}

ConversionResult ConversionExecutor::convert(const std::string& input_file) const {
    const io::DecodeOptions options = config::toDecodeOptions(config_);

    if (config_.require_format_check &&
        io::FileFormatDetector::detectByContent(input_file, options.encoding) != io::FileFormat::KNET_ASCII) {
        return makeErrorResult(input_file, "not a K-NET ASCII file");
    }

    ConversionResult result;
    result.input_file = input_file;
    try {
        result.record = io::KnetReader::readFile(input_file, options);
    } catch (const KnetException& e) {
        return makeErrorResult(input_file, e.what());
    }

    if (config_.save_hdf5) {
        const std::string output_file = io::archivePathFor(config_.hdf5_output_dir, result.record);
        std::string err;
        if (!io::writeRecordArchive(output_file, result.record, err)) {
            return makeErrorResult(input_file, err);
        }
        result.output_file = output_file;
    }

    result.success = true;
    return result;
}

ConversionResult ConversionExecutor::makeErrorResult(const std::string& input_file,
                                                     const std::string& message) const {
    ConversionResult result;
    result.success = false;
    result.input_file = input_file;
    result.error_message = message;
    return result;
}

std::size_t runConversion(const config::ConverterConfig& config,
                          const ConversionSuccessCallback& on_success,
                          std::string* error_message) {
    ConversionExecutor executor(config);
    utils::ErrorAccumulator error_acc;
    std::size_t converted = 0;

    for (const auto& input_file : config.input_files) {
        const ConversionResult result = executor.convert(input_file);
        if (!result.success) {
            error_acc.add(input_file, result.error_message);
            continue;
        }
        ++converted;
        if (on_success) {
            on_success(result);
        }
    }

    if (error_message) {
        *error_message = error_acc.str();
    }
    return converted;
}

}  // namespace knet_reader::services
