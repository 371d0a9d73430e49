// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_IO_TEXT_DECODER_HPP
#define KNET_READER_IO_TEXT_DECODER_HPP

#include <iconv.h>

#include <cstddef>
#include <string>

namespace knet_reader::io {

// Converts bytes in a named encoding to UTF-8 through iconv.
class TextDecoder {
public:
    struct PrefixResult {
        std::string text;            // UTF-8
        std::size_t characters = 0;  // code points in text
        bool invalid = false;        // stopped by an invalid byte sequence
    };

    // Throws KnetException(EncodingError) when iconv does not know the encoding.
    explicit TextDecoder(const std::string& encoding);
    ~TextDecoder();

    TextDecoder(const TextDecoder&) = delete;
    TextDecoder& operator=(const TextDecoder&) = delete;

    // Whole-buffer conversion. Invalid or truncated input throws
    // KnetException(EncodingError).
    std::string decode(const std::string& bytes);

    // Converts at most max_chars characters from the front of bytes. Never
    // throws; an incomplete trailing sequence simply ends the prefix.
    PrefixResult decodePrefix(const std::string& bytes, std::size_t max_chars);

    const std::string& encoding() const { return encoding_; }

    // Codeset of the environment's LC_CTYPE locale. The plain C/POSIX locale
    // maps to UTF-8, as does any lookup failure.
    static std::string preferredEncoding();

    static std::size_t countCodePoints(const std::string& utf8);

private:
    std::string encoding_;
    iconv_t cd_;

    // Returns false on an invalid sequence; stops silently on incomplete input
    // when allow_truncated is set.
    bool convert(const std::string& bytes, std::string& out, bool allow_truncated, int& error_code);
};

}  // namespace knet_reader::io

#endif  // KNET_READER_IO_TEXT_DECODER_HPP
