/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "utils.h"

#include <cerrno>
#include <cstdlib>

namespace mtd::utils {

bool parseInt64(const std::string& str, int64_t& out) {
    if (str.empty())
        return false;

    const char* begin = str.c_str();
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(begin, &end, 10);

    if (end == begin || *end != '\0' || errno == ERANGE)
        return false;

    // strtoll accepts leading whitespace
    if (std::isspace(static_cast<unsigned char>(str[0])))
        return false;

    out = static_cast<int64_t>(v);
    return true;
}

std::string join(const std::vector<std::string>& vec, char separator) {
    std::stringstream ss;
    for (size_t i = 0; i < vec.size(); i++) {
        if (i > 0)
            ss << separator;
        ss << vec[i];
    }

    return ss.str();
}

std::vector<std::string> parseList(const std::string& str) {
    std::vector<std::string> res;

    for (auto& item : split(str, ",")) {
        trim(item);
        if (!item.empty())
            res.push_back(item);
    }

    return res;
}

}  // namespace mtd::utils
