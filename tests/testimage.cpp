/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "testimage.h"

#include <fstream>
#include "exceptions.h"

void createJpeg(const fs::path &p, const std::map<std::string, std::string> &tags) {
    Exiv2::ExifData exifData;
    for (auto &t : tags) exifData[t.first] = t.second;
    createJpeg(p, exifData);
}

void createJpeg(const fs::path &p, const Exiv2::ExifData &exifData) {
    if (fs::exists(p)) fs::remove(p);

    auto image = Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg, p.string());
    if (!exifData.empty()) {
        image->setExifData(exifData);
        image->writeMetadata();
    }
}

Exiv2::ExifData readExif(const fs::path &p) {
    auto image = Exiv2::ImageFactory::open(p.string());
    image->readMetadata();
    return image->exifData();
}

void writeTextFile(const fs::path &p, const std::string &content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw mtd::FSException("Cannot write " + p.string());
    out << content;
}
