/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_PARSE_HPP
#define __SATDELIVER_PARSE_HPP

#include <charconv>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace satdeliver {

using time_point = std::chrono::system_clock::time_point;

// Text parsing helpers shared by the TLE, CSV and option readers.

std::string_view trimLeft(std::string_view str);
std::string_view trimRight(std::string_view str);
std::string_view trim(std::string_view str);

/**
 * Convert the whole of str to a number.
 * @throws std::invalid_argument if str is not entirely a number
 */
template <typename T>
T toNumber(std::string_view str) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Couldn't convert value: " + std::string(str));
    }
    return value;
}

/**
 * Split on a delimiter, trimming whitespace from each field.
 */
std::vector<std::string_view> splitFields(std::string_view str, char delimiter);

/**
 * Parse a "%Y-%m-%d %H:%M:%S" UTC timestamp.
 * @throws std::invalid_argument if the text does not match
 */
time_point parseTimestamp(std::string_view str);

/**
 * Format as "%Y-%m-%d %H:%M:%S UTC" with whole seconds.
 */
std::string formatTimestamp(time_point tp);

}

#endif
