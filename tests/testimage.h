/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef TESTIMAGE_H
#define TESTIMAGE_H

#include <map>
#include <string>
#include <exiv2/exiv2.hpp>
#include "fs.h"

// Writes a blank JPEG with the given EXIF tags (key => value as text).
// No tags means no EXIF block.
void createJpeg(const fs::path &p, const std::map<std::string, std::string> &tags = {});

// Writes a blank JPEG and lets the caller fill its EXIF data
void createJpeg(const fs::path &p, const Exiv2::ExifData &exifData);

Exiv2::ExifData readExif(const fs::path &p);

void writeTextFile(const fs::path &p, const std::string &content);

#endif // TESTIMAGE_H
