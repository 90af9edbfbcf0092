/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef EXIF_H
#define EXIF_H

#include <exiv2/exiv2.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "fs.h"
#include "capturedate.h"
#include "coordinates.h"

namespace mtd
{

    /**
     * @brief In-memory copy of an image with its EXIF block.
     *
     * Opened once per file, read by the EXIF extractor, modified by the
     * metadata writer and finally serialized back to bytes.
     */
    class ExifContainer
    {
        std::vector<uint8_t> data;
        Exiv2::Image::UniquePtr image;
        bool modified;

        explicit ExifContainer(std::vector<uint8_t> &&data) : data(std::move(data)), modified(false) {};

    public:
        /**
         * @brief Opens the EXIF block of a file.
         * @return nullptr if the file is not an image Exiv2 can parse
         *         or if it has no EXIF data
         */
        static std::unique_ptr<ExifContainer> open(const fs::path &file);
        static std::unique_ptr<ExifContainer> open(std::vector<uint8_t> &&data);

        ExifContainer(const ExifContainer &) = delete;
        ExifContainer &operator=(const ExifContainer &) = delete;

        Exiv2::ExifData::const_iterator findExifKey(const std::string &key) const;
        Exiv2::ExifData::const_iterator findExifKey(const std::initializer_list<std::string> &keys) const;

        std::optional<CaptureDate> readDate() const;
        std::optional<DMSCoordinates> readLocation() const;

        void writeDate(const CaptureDate &date);

        // Throws ExifException if existing GPS tags have an unexpected type,
        // in which case nothing is modified
        void writeLocation(const DMSCoordinates &location);

        // Image bytes including the (possibly modified) EXIF block
        std::vector<uint8_t> serialize();

        bool hasExif() const;
        bool isModified() const { return modified; }
        const std::vector<uint8_t> &originalData() const { return data; }

    private:
        bool readDMS(const Exiv2::ExifData::const_iterator &tag, const Exiv2::ExifData::const_iterator &refTag, DMS &dms) const;
        double evalFrac(const Exiv2::Rational &rational) const;
        void checkType(const std::string &key, Exiv2::TypeId expected) const;
    };

    // Formats a DMS value as an EXIF rational triplet ("d/1 m/1 s/10000")
    std::string dmsToRationalString(const DMS &dms);

}

#endif // EXIF_H
