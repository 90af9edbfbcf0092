/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CAPTUREDATE_H
#define CAPTUREDATE_H

#include <ctime>
#include <optional>
#include <ostream>
#include <string>

namespace mtd
{

    /**
     * @brief Wall clock date and time of a capture.
     *
     * EXIF and file name dates carry no timezone and are interpreted
     * as local time; sidecar timestamps are UTC.
     */
    struct CaptureDate
    {
        int year;
        int month;  // 1-12
        int day;    // 1-31
        int hour;
        int minute;
        int second;
        bool utc;

        CaptureDate() : year(1970), month(1), day(1), hour(0), minute(0), second(0), utc(false) {}
        CaptureDate(int year, int month, int day, int hour, int minute, int second, bool utc = false) : year(year), month(month), day(day), hour(hour), minute(minute), second(second), utc(utc) {}

        static CaptureDate fromTm(const std::tm &tm, bool utc = false);
        static CaptureDate fromEpoch(time_t t, bool utc = false);

        // Parses text with a strptime format. The whole text must match.
        static std::optional<CaptureDate> parse(const std::string &text, const std::string &format, bool utc = false);

        std::tm toTm() const;

        // Seconds since Jan 1st 1970 UTC
        time_t toEpoch() const;

        // "YYYY:MM:DD HH:MM:SS"
        std::string toExifString() const;

        // "YYYY-MM-DDTHH:MM:SS" with a "+00:00" suffix for UTC dates
        std::string toIsoString() const;

        bool operator==(const CaptureDate &o) const;
        bool operator!=(const CaptureDate &o) const { return !(*this == o); }
    };

    std::ostream &operator<<(std::ostream &os, const CaptureDate &d);

}

#endif // CAPTUREDATE_H
