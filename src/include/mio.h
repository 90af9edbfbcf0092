/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef MIO_H
#define MIO_H

// "My" I/O library
// io.h was taken :/

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include "fs.h"

namespace mtd{
namespace io{

class Path{
    fs::path p;

public:
    Path(){}
    Path(const fs::path &p) : p(p) {}

    // Compares an extension with a list of extension strings
    // @return true if the extension matches one of those in the list
    bool checkExtension(const std::vector<std::string>& matches) const;

    // Whether the file name starts with a dot
    bool isHidden() const;

    time_t getModifiedTime() const;
    time_t getAccessTime() const;

    std::string string() const;
    fs::path get() const{ return p; }
};

void createDirectories(const fs::path &d);

// Reads the entire content of a file
std::vector<uint8_t> readFile(const fs::path &p);

// Writes data to a temporary file next to p,
// then moves it in place
void writeFile(const fs::path &p, const std::vector<uint8_t> &data);

// Sets both access and modification times
void setFileTimes(const fs::path &p, time_t t);

}
}
#endif // MIO_H
