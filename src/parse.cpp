/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/parse.hpp>

#include <sstream>

#include <date/date.h>

namespace satdeliver {

std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(" \t");
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(" \t\r");
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

std::string_view trim(std::string_view str) {
    return trimLeft(trimRight(str));
}

std::vector<std::string_view> splitFields(std::string_view str, char delimiter) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(trim(str.substr(start)));
            return fields;
        }
        fields.push_back(trim(str.substr(start, pos - start)));
        start = pos + 1;
    }
}

time_point parseTimestamp(std::string_view str) {
    std::istringstream in{std::string(trim(str))};
    date::sys_time<std::chrono::seconds> tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        throw std::invalid_argument("Invalid timestamp: " + std::string(str));
    }
    return tp;
}

std::string formatTimestamp(time_point tp) {
    return date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(tp));
}

}
