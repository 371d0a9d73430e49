// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_SERVICES_CONVERSION_EXECUTOR_HPP
#define KNET_READER_SERVICES_CONVERSION_EXECUTOR_HPP

#include <cstddef>
#include <functional>
#include <string>

#include "knet_reader/config/ConverterConfig.hpp"
#include "knet_reader/core/TimeSeriesRecord.hpp"

namespace knet_reader::services {

struct ConversionResult {
    bool success = false;
    std::string input_file;
    std::string output_file;  // empty when no archive was written
    std::string error_message;
    TimeSeriesRecord record;
};

using ConversionSuccessCallback = std::function<void(const ConversionResult&)>;

// Decodes one input file per call and optionally archives it to HDF5.
class ConversionExecutor {
public:
    explicit ConversionExecutor(config::ConverterConfig config);

    ConversionResult convert(const std::string& input_file) const;

    const config::ConverterConfig& config() const { return config_; }

private:
    config::ConverterConfig config_;

    ConversionResult makeErrorResult(const std::string& input_file, const std::string& message) const;
};

// Converts every input file of config, calling on_success for each record
// that decoded (and archived, when enabled). Failures do not stop the batch;
// they are collected into error_message. Returns the number of successes.
std::size_t runConversion(const config::ConverterConfig& config,
                          const ConversionSuccessCallback& on_success,
                          std::string* error_message = nullptr);

}  // namespace knet_reader::services

#endif  // KNET_READER_SERVICES_CONVERSION_EXECUTOR_HPP
