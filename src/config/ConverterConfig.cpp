// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/config/ConverterConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace knet_reader::config {

namespace {

YAML::Node extractParameterNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return YAML::Node();
    }

    if (root["knet_converter"]) {
        auto node = root["knet_converter"];
        if (node["ros__parameters"]) {
            return node["ros__parameters"];
        }
        return node;
    }

    if (root["ros__parameters"]) {
        return root["ros__parameters"];
    }

    return root;
}

template <typename T>
T readOrDefault(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (!node || !node[key]) {
        return default_value;
    }
    return node[key].as<T>();
}

std::vector<std::string> readInputFiles(const YAML::Node& params) {
    std::vector<std::string> files;
    if (params && params["input_files"]) {
        const auto node = params["input_files"];
        if (node.IsScalar()) {
            files.push_back(node.as<std::string>());
        } else {
            files = node.as<std::vector<std::string>>();
        }
    }
    const auto single = readOrDefault<std::string>(params, "input_file", "");
    if (!single.empty()) {
        files.push_back(single);
    }
    return files;
}

}  // namespace

ConverterConfig loadConverterConfigFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    YAML::Node params = extractParameterNode(root);

    ConverterConfig config;
    config.input_files = readInputFiles(params);
    config.encoding = readOrDefault<std::string>(params, "encoding", "");
    config.convert_station_name =
        readOrDefault<bool>(params, "convert_station_name", config.convert_station_name);
    config.require_format_check =
        readOrDefault<bool>(params, "require_format_check", config.require_format_check);
    config.save_hdf5 = readOrDefault<bool>(params, "save_hdf5", config.save_hdf5);
    config.hdf5_output_dir = readOrDefault<std::string>(params, "hdf5_output_dir", "");
    config.print_summary = readOrDefault<bool>(params, "print_summary", config.print_summary);
    return config;
}

std::vector<std::string> ConverterConfig::validate(bool check_filesystem) const {
    std::vector<std::string> errors;
    if (input_files.empty()) {
        errors.emplace_back("input_files is empty");
    }
    for (const auto& input : input_files) {
        if (input.empty()) {
            errors.emplace_back("input_files contains an empty path");
        } else if (check_filesystem && !std::filesystem::exists(input)) {
            errors.emplace_back("input file does not exist: " + input);
        }
    }

    if (save_hdf5 && hdf5_output_dir.empty()) {
        errors.emplace_back("hdf5_output_dir must be set when save_hdf5 is true");
    } else if (save_hdf5 && check_filesystem && !std::filesystem::is_directory(hdf5_output_dir)) {
        errors.emplace_back("hdf5_output_dir is not a directory: " + hdf5_output_dir);
    }
    return errors;
}

io::DecodeOptions toDecodeOptions(const ConverterConfig& config) {
    io::DecodeOptions options;
    if (!config.encoding.empty()) {
        options.encoding = config.encoding;
    }
    options.convert_station_name = config.convert_station_name;
    return options;
}

}  // namespace knet_reader::config
