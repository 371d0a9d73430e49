// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_FILE_FORMAT_DETECTOR_HPP
#define KNET_READER_IO_FILE_FORMAT_DETECTOR_HPP

#include <istream>
#include <optional>
#include <string>

namespace knet_reader::io {

// Supported file formats
enum class FileFormat {
    UNKNOWN,
    KNET_ASCII
};

// True when the first 11 characters of the stream, decoded with encoding (or
// the platform preferred encoding), are "Origin Time" and the whole sniffed
// prefix decodes cleanly. Consumes a bounded prefix of the stream and never
// throws.
bool isKnetAscii(std::istream& stream, const std::optional<std::string>& encoding = std::nullopt);

// File format detection utility
class FileFormatDetector {
public:
    // Detect file format by content first, then by extension
    static FileFormat detectFormat(const std::string& filename,
                                   const std::optional<std::string>& encoding = std::nullopt);

    // Detect format by file extension only (.NS, .EW, .UD, .NS1 ... .UD2)
    static FileFormat detectByExtension(const std::string& filename);

    // Detect format by file content (header)
    static FileFormat detectByContent(const std::string& filename,
                                      const std::optional<std::string>& encoding = std::nullopt);

    static std::string formatToString(FileFormat format);

    static bool isSupportedFormat(FileFormat format);

    // Get file extension from filename, including the dot
    static std::string getFileExtension(const std::string& filename);

private:
    static std::string normalizeExtension(const std::string& extension);
};

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_FILE_FORMAT_DETECTOR_HPP
