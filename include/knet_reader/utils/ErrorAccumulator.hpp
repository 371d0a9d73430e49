// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef KNET_READER_UTILS_ERROR_ACCUMULATOR_HPP
#define KNET_READER_UTILS_ERROR_ACCUMULATOR_HPP

#include <cstddef>
#include <string>

namespace knet_reader::utils {

// Collects per-file failures into one "; "-separated message.
class ErrorAccumulator {
public:
    void add(const std::string& message) {
        if (message.empty()) {
            return;
        }
        if (!messages_.empty()) {
            messages_ += "; ";
        }
        messages_ += message;
        ++count_;
    }

    void add(const std::string& source, const std::string& message) {
        if (message.empty()) {
            return;
        }
        add(source + ": " + message);
    }

    bool empty() const {
        return messages_.empty();
    }

    std::size_t count() const {
        return count_;
    }

    const std::string& str() const {
        return messages_;
    }

    void clear() {
        messages_.clear();
        count_ = 0;
    }

private:
    std::string messages_;
    std::size_t count_ = 0;
};

}  // namespace knet_reader::utils

#endif  // KNET_READER_UTILS_ERROR_ACCUMULATOR_HPP
