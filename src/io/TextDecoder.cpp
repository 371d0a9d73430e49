// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "knet_reader/io/TextDecoder.hpp"

#include <langinfo.h>
#include <locale.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "knet_reader/core/KnetException.hpp"

namespace knet_reader::io {

namespace {

const iconv_t kInvalidDescriptor = reinterpret_cast<iconv_t>(-1);

}  // namespace

TextDecoder::TextDecoder(const std::string& encoding)
    : encoding_(encoding), cd_(iconv_open("UTF-8", encoding.c_str())) {
    if (cd_ == kInvalidDescriptor) {
        throw KnetException(KnetErrorKind::EncodingError, "Unsupported text encoding: " + encoding);
    }
}

TextDecoder::~TextDecoder() {
    if (cd_ != kInvalidDescriptor) {
        iconv_close(cd_);
    }
}

std::string TextDecoder::decode(const std::string& bytes) {
    std::string out;
    int error_code = 0;
    if (!convert(bytes, out, false, error_code)) {
        throw KnetException(KnetErrorKind::EncodingError,
                            "Cannot decode line as " + encoding_ + ": " + std::strerror(error_code));
    }
    return out;
}

TextDecoder::PrefixResult TextDecoder::decodePrefix(const std::string& bytes, std::size_t max_chars) {
    PrefixResult result;
    int error_code = 0;
    result.invalid = !convert(bytes, result.text, true, error_code);

    // Trim to max_chars code points.
    std::size_t chars = 0;
    std::size_t cut = result.text.size();
    for (std::size_t i = 0; i < result.text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(result.text[i]);
        if ((byte & 0xC0) != 0x80) {
            if (chars == max_chars) {
                cut = i;
                break;
            }
            ++chars;
        }
    }
    result.text.resize(cut);
    result.characters = chars;
    return result;
}

bool TextDecoder::convert(const std::string& bytes, std::string& out, bool allow_truncated, int& error_code) {
    iconv(cd_, nullptr, nullptr, nullptr, nullptr);
    out.clear();
    if (bytes.empty()) {
        return true;
    }

    std::vector<char> input(bytes.begin(), bytes.end());
    char* in_ptr = input.data();
    std::size_t in_left = input.size();

    std::vector<char> buffer(bytes.size() * 4 + 16);
    while (true) {
        char* out_ptr = buffer.data();
        std::size_t out_left = buffer.size();
        const std::size_t rc = iconv(cd_, &in_ptr, &in_left, &out_ptr, &out_left);
        const int conversion_errno = errno;
        out.append(buffer.data(), buffer.size() - out_left);

        if (rc != static_cast<std::size_t>(-1)) {
            break;
        }
        if (conversion_errno == E2BIG) {
            continue;
        }
        error_code = conversion_errno;
        if (conversion_errno == EINVAL && allow_truncated) {
            return true;
        }
        return false;
    }

    char* out_ptr = buffer.data();
    std::size_t out_left = buffer.size();
    iconv(cd_, nullptr, nullptr, &out_ptr, &out_left);
    out.append(buffer.data(), buffer.size() - out_left);
    return true;
}

std::string TextDecoder::preferredEncoding() {
    locale_t loc = newlocale(LC_CTYPE_MASK, "", static_cast<locale_t>(0));
    if (loc == static_cast<locale_t>(0)) {
        return "UTF-8";
    }

    std::string codeset;
    const char* name = nl_langinfo_l(CODESET, loc);
    if (name != nullptr) {
        codeset = name;
    }
    freelocale(loc);

    if (codeset.empty() || codeset == "ANSI_X3.4-1968" || codeset == "ASCII") {
        return "UTF-8";
    }
    return codeset;
}

std::size_t TextDecoder::countCodePoints(const std::string& utf8) {
    std::size_t count = 0;
    for (char c : utf8) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}  // namespace knet_reader::io
