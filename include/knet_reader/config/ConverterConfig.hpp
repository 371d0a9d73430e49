// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_CONFIG_CONVERTER_CONFIG_HPP
#define KNET_READER_CONFIG_CONVERTER_CONFIG_HPP

#include <string>
#include <vector>

#include "knet_reader/io/DecodeOptions.hpp"

namespace knet_reader::config {

struct ConverterConfig {
    std::vector<std::string> input_files;
    std::string encoding;  // empty: platform preferred encoding
    bool convert_station_name = false;
    bool require_format_check = true;
    bool save_hdf5 = false;
    std::string hdf5_output_dir;
    bool print_summary = true;

    std::vector<std::string> validate(bool check_filesystem = true) const;
};

ConverterConfig loadConverterConfigFromYaml(const std::string& path);

io::DecodeOptions toDecodeOptions(const ConverterConfig& config);

}  // namespace knet_reader::config

#endif  // KNET_READER_CONFIG_CONVERTER_CONFIG_HPP
