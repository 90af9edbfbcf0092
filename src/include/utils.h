/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "exceptions.h"
#include "fs.h"
#include "logger.h"

namespace mtd {
namespace utils {

static inline void toLower(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](int ch) { return std::tolower(ch); });
}

static inline void toUpper(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](int ch) { return std::toupper(ch); });
}

static inline void ltrim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
}

static inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(),
            s.end());
}

static inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

static inline std::vector<std::string> split(const std::string& s, const std::string& delimiter) {
    size_t posStart = 0, posEnd, delimLen = delimiter.length();
    std::string token;
    std::vector<std::string> res;

    while ((posEnd = s.find(delimiter, posStart)) != std::string::npos) {
        token = s.substr(posStart, posEnd - posStart);
        posStart = posEnd + delimLen;
        res.push_back(token);
    }

    res.push_back(s.substr(posStart));
    return res;
}

// https://stackoverflow.com/questions/2342162/stdstring-formatting-like-sprintf/25440014
template <typename... Args>
std::string stringFormat(const std::string& format, Args... args) {
    const int size = snprintf(nullptr, 0, format.c_str(), args...) + 1;  // Extra space for '\0'
    if (size <= 0) {
        throw std::runtime_error("Error during formatting.");
    }
    const std::unique_ptr<char[]> buf(new char[size]);
    snprintf(buf.get(), size, format.c_str(), args...);
    return std::string(buf.get(), buf.get() + size - 1);  // We don't want the '\0' inside
}

// Parses a base 10 integer, rejecting trailing characters
// @return true on success
bool parseInt64(const std::string& str, int64_t& out);

std::string join(const std::vector<std::string>& vec, char separator = ',');

// Splits a comma separated list, trimming each item and dropping empty ones
std::vector<std::string> parseList(const std::string& str);

}  // namespace utils
}  // namespace mtd

#endif  // UTILS_H
