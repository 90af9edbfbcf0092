/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "exif.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "mio.h"
#include "utils.h"

namespace mtd
{

    std::unique_ptr<ExifContainer> ExifContainer::open(const fs::path &file)
    {
        return open(io::readFile(file));
    }

    std::unique_ptr<ExifContainer> ExifContainer::open(std::vector<uint8_t> &&data)
    {
        if (data.empty())
            return nullptr;

        // The image reads from our buffer without copying it
        std::unique_ptr<ExifContainer> c(new ExifContainer(std::move(data)));

        try
        {
            c->image = Exiv2::ImageFactory::open(c->data.data(), c->data.size());
            if (!c->image)
                return nullptr;
            c->image->readMetadata();
        }
        catch (const Exiv2::Error &e)
        {
            LOGD << "Cannot read metadata: " << e.what();
            return nullptr;
        }

        if (!c->hasExif())
        {
            LOGD << "No EXIF data";
            return nullptr;
        }

        return c;
    }

    Exiv2::ExifData::const_iterator ExifContainer::findExifKey(const std::string &key) const
    {
        return findExifKey({key});
    }

    // Find the first available key, or exifData::end() if none exist
    Exiv2::ExifData::const_iterator ExifContainer::findExifKey(const std::initializer_list<std::string> &keys) const
    {
        const Exiv2::ExifData &exifData = image->exifData();
        for (auto &k : keys)
        {
            auto it = exifData.findKey(Exiv2::ExifKey(k));
            if (it != exifData.end())
                return it;
        }
        return exifData.end();
    }

    // The date field holds either milliseconds since epoch
    // or "YYYY:MM:DD HH:MM:SS"
    std::optional<CaptureDate> ExifContainer::readDate() const
    {
        const Exiv2::ExifData &exifData = image->exifData();
        auto time = findExifKey({"Exif.Image.DateTime", "Exif.Photo.DateTimeOriginal"});
        if (time == exifData.end())
            return std::nullopt;

        std::string value = time->toString();
        utils::trim(value);

        int64_t msecs;
        if (utils::parseInt64(value, msecs))
        {
            try
            {
                return CaptureDate::fromEpoch(static_cast<time_t>(msecs / 1000));
            }
            catch (const InvalidArgsException &e)
            {
                LOGD << e.what();
                return std::nullopt;
            }
        }

        auto date = CaptureDate::parse(value, EXIF_DATETIME_FORMAT);
        if (!date)
            LOGD << "Invalid date/time format: " << value;

        return date;
    }

    // Both coordinates and their references must be there,
    // partial GPS data counts as no data
    std::optional<DMSCoordinates> ExifContainer::readLocation() const
    {
        auto latitude = findExifKey("Exif.GPSInfo.GPSLatitude");
        auto latitudeRef = findExifKey("Exif.GPSInfo.GPSLatitudeRef");
        auto longitude = findExifKey("Exif.GPSInfo.GPSLongitude");
        auto longitudeRef = findExifKey("Exif.GPSInfo.GPSLongitudeRef");

        DMS lat, lon;
        if (!readDMS(latitude, latitudeRef, lat) || !readDMS(longitude, longitudeRef, lon))
            return std::nullopt;

        return DMSCoordinates(lat, lon);
    }

    bool ExifContainer::readDMS(const Exiv2::ExifData::const_iterator &tag, const Exiv2::ExifData::const_iterator &refTag, DMS &dms) const
    {
        const Exiv2::ExifData &exifData = image->exifData();
        if (tag == exifData.end() || refTag == exifData.end())
            return false;

        if (tag->count() != 3 || (tag->typeId() != Exiv2::unsignedRational && tag->typeId() != Exiv2::signedRational))
        {
            LOGD << "Unexpected shape for " << tag->key() << ": " << tag->typeName() << "[" << tag->count() << "]";
            return false;
        }

        std::string ref = refTag->toString();
        utils::trim(ref);
        utils::toUpper(ref);
        if (ref.empty())
            return false;

        double degrees = evalFrac(tag->toRational(0));
        double minutes = evalFrac(tag->toRational(1));
        double seconds = evalFrac(tag->toRational(2));

        // Some writers store fractional degrees or minutes
        double value = std::fabs(degrees + minutes / 60.0 + seconds / 3600.0);
        dms.degrees = static_cast<int>(value);
        double fracMinutes = (value - dms.degrees) * 60.0;
        dms.minutes = static_cast<int>(fracMinutes);
        dms.seconds = (fracMinutes - dms.minutes) * 60.0;
        dms.ref = ref[0];

        return true;
    }

    // Evaluates a rational
    double ExifContainer::evalFrac(const Exiv2::Rational &rational) const
    {
        if (rational.second == 0)
            return 0.0;
        return static_cast<double>(rational.first) / static_cast<double>(rational.second);
    }

    void ExifContainer::writeDate(const CaptureDate &date)
    {
        Exiv2::ExifData &exifData = image->exifData();
        exifData["Exif.Image.DateTime"] = date.toExifString();
        modified = true;

        LOGD << "Setting date to " << exifData["Exif.Image.DateTime"].toString();
    }

    void ExifContainer::checkType(const std::string &key, Exiv2::TypeId expected) const
    {
        const Exiv2::ExifData &exifData = image->exifData();
        auto it = findExifKey(key);
        if (it != exifData.end() && it->typeId() != expected)
        {
            throw ExifException("Unexpected type for " + key + ": " + it->typeName());
        }
    }

    void ExifContainer::writeLocation(const DMSCoordinates &location)
    {
        checkType("Exif.GPSInfo.GPSLatitude", Exiv2::unsignedRational);
        checkType("Exif.GPSInfo.GPSLongitude", Exiv2::unsignedRational);
        checkType("Exif.GPSInfo.GPSLatitudeRef", Exiv2::asciiString);
        checkType("Exif.GPSInfo.GPSLongitudeRef", Exiv2::asciiString);

        Exiv2::ExifData &exifData = image->exifData();
        exifData["Exif.GPSInfo.GPSLatitude"] = dmsToRationalString(location.latitude);
        exifData["Exif.GPSInfo.GPSLatitudeRef"] = std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(location.latitude.ref))));
        exifData["Exif.GPSInfo.GPSLongitude"] = dmsToRationalString(location.longitude);
        exifData["Exif.GPSInfo.GPSLongitudeRef"] = std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(location.longitude.ref))));
        modified = true;

        LOGD << "Setting lat: " <<
                exifData["Exif.GPSInfo.GPSLatitude"].toString() << " " <<
                exifData["Exif.GPSInfo.GPSLatitudeRef"].toString() << " " <<
                "lon: " <<
                exifData["Exif.GPSInfo.GPSLongitude"].toString() << " " <<
                exifData["Exif.GPSInfo.GPSLongitudeRef"].toString();
    }

    std::vector<uint8_t> ExifContainer::serialize()
    {
        image->writeMetadata();

        Exiv2::BasicIo &io = image->io();
        if (io.open() != 0)
            throw ExifException("Cannot open image buffer");
        Exiv2::IoCloser closer(io);

        io.seek(0, Exiv2::BasicIo::beg);
        Exiv2::DataBuf buf = io.read(io.size());
        if (buf.size() != io.size())
            throw ExifException("Cannot read image buffer");

        return std::vector<uint8_t>(buf.c_data(), buf.c_data() + buf.size());
    }

    bool ExifContainer::hasExif() const
    {
        return image && !image->exifData().empty();
    }

    // Convert a DMS value into an EXIF rational triplet
    std::string dmsToRationalString(const DMS &dms)
    {
        const long long sec = std::llround(std::fabs(dms.seconds) * 10000.0);

        return std::to_string(std::abs(dms.degrees)) + "/1 " +
               std::to_string(std::abs(dms.minutes)) + "/1 " +
               std::to_string(sec) + "/10000";
    }

}
