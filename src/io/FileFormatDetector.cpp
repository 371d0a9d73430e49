// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/io/FileFormatDetector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <ios>

#include "knet_reader/core/KnetException.hpp"
#include "knet_reader/io/TextDecoder.hpp"

namespace knet_reader::io {

namespace {

constexpr const char* kKnetSignature = "Origin Time";
constexpr std::size_t kSignatureLength = 11;
// Enough bytes for 11 characters in any encoding iconv offers, BOM included.
constexpr std::size_t kSniffByteBudget = 64;

constexpr std::array<const char*, 9> kKnetExtensions = {
    ".NS", ".EW", ".UD", ".NS1", ".EW1", ".UD1", ".NS2", ".EW2", ".UD2"};

}  // namespace

bool isKnetAscii(std::istream& stream, const std::optional<std::string>& encoding) {
    try {
        std::string prefix(kSniffByteBudget, '\0');
        stream.read(&prefix[0], static_cast<std::streamsize>(prefix.size()));
        prefix.resize(static_cast<std::size_t>(stream.gcount()));

        TextDecoder decoder(encoding.value_or(TextDecoder::preferredEncoding()));
        const auto decoded = decoder.decodePrefix(prefix, kSignatureLength);
        // Any undecodable byte in the sniffed prefix rejects the stream. A
        // multibyte sequence cut at the byte budget is not an error.
        if (decoded.invalid || decoded.characters != kSignatureLength) {
            return false;
        }
        return decoded.text == kKnetSignature;
    } catch (const KnetException&) {
        return false;
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

FileFormat FileFormatDetector::detectFormat(const std::string& filename,
                                            const std::optional<std::string>& encoding) {
    // Check if file exists first
    if (!std::filesystem::exists(filename)) {
        return FileFormat::UNKNOWN;
    }

    // First try content-based detection (more reliable)
    FileFormat content_format = detectByContent(filename, encoding);
    if (content_format != FileFormat::UNKNOWN) {
        return content_format;
    }

    // Fall back to extension-based detection
    return detectByExtension(filename);
}

FileFormat FileFormatDetector::detectByExtension(const std::string& filename) {
    if (filename.empty()) {
        return FileFormat::UNKNOWN;
    }

    const std::string normalized = normalizeExtension(getFileExtension(filename));
    const bool known = std::any_of(kKnetExtensions.begin(), kKnetExtensions.end(),
                                   [&](const char* ext) { return normalized == ext; });
    return known ? FileFormat::KNET_ASCII : FileFormat::UNKNOWN;
}

FileFormat FileFormatDetector::detectByContent(const std::string& filename,
                                               const std::optional<std::string>& encoding) {
    if (!std::filesystem::exists(filename) || std::filesystem::is_directory(filename)) {
        return FileFormat::UNKNOWN;
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return FileFormat::UNKNOWN;
    }

    return isKnetAscii(file, encoding) ? FileFormat::KNET_ASCII : FileFormat::UNKNOWN;
}

std::string FileFormatDetector::formatToString(FileFormat format) {
    switch (format) {
        case FileFormat::KNET_ASCII:
            return "K-NET ASCII";
        case FileFormat::UNKNOWN:
        default:
            return "UNKNOWN";
    }
}

bool FileFormatDetector::isSupportedFormat(FileFormat format) {
    return format == FileFormat::KNET_ASCII;
}

std::string FileFormatDetector::getFileExtension(const std::string& filename) {
    if (filename.empty()) {
        return "";
    }

    size_t dot_pos = filename.find_last_of('.');
    size_t slash_pos = filename.find_last_of("/\\");

    // Check if dot is after the last slash (to handle paths like "/path/to/.hidden")
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos) ||
        dot_pos == filename.length() - 1) {
        return "";
    }

    // A leading dot marks a hidden file, not an extension
    size_t filename_start = (slash_pos == std::string::npos) ? 0 : slash_pos + 1;
    if (dot_pos == filename_start) {
        return "";
    }

    return filename.substr(dot_pos);
}

std::string FileFormatDetector::normalizeExtension(const std::string& extension) {
    std::string normalized = extension;

    // K-NET component extensions are upper case
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    return normalized;
}

}  // namespace knet_reader::io
