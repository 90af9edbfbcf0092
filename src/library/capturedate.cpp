/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "capturedate.h"

#include <ctime>
#include "exceptions.h"
#include "utils.h"

namespace mtd
{

    CaptureDate CaptureDate::fromTm(const std::tm &tm, bool utc)
    {
        return CaptureDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec, utc);
    }

    CaptureDate CaptureDate::fromEpoch(time_t t, bool utc)
    {
        std::tm tm{};
        const bool ok = utc ? gmtime_r(&t, &tm) != nullptr : localtime_r(&t, &tm) != nullptr;
        if (!ok)
            throw InvalidArgsException("Timestamp out of range: " + std::to_string(t));

        return fromTm(tm, utc);
    }

    std::optional<CaptureDate> CaptureDate::parse(const std::string &text, const std::string &format, bool utc)
    {
        std::tm tm{};
        tm.tm_mday = 1; // Formats without a day start on the 1st

        const char *end = strptime(text.c_str(), format.c_str(), &tm);
        if (end == nullptr || *end != '\0')
            return std::nullopt;

        // strptime checks each field on its own, reject days like Feb 30
        std::tm check = tm;
        check.tm_isdst = 0;
        const time_t t = timegm(&check);
        std::tm normalized{};
        if (gmtime_r(&t, &normalized) == nullptr ||
            normalized.tm_year != tm.tm_year || normalized.tm_mon != tm.tm_mon ||
            normalized.tm_mday != tm.tm_mday || normalized.tm_hour != tm.tm_hour ||
            normalized.tm_min != tm.tm_min || normalized.tm_sec != tm.tm_sec)
            return std::nullopt;

        return fromTm(tm, utc);
    }

    std::tm CaptureDate::toTm() const
    {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        tm.tm_isdst = -1;
        return tm;
    }

    time_t CaptureDate::toEpoch() const
    {
        std::tm tm = toTm();
        return utc ? timegm(&tm) : mktime(&tm);
    }

    std::string CaptureDate::toExifString() const
    {
        return utils::stringFormat("%04d:%02d:%02d %02d:%02d:%02d", year, month, day, hour, minute, second);
    }

    std::string CaptureDate::toIsoString() const
    {
        return utils::stringFormat("%04d-%02d-%02dT%02d:%02d:%02d", year, month, day, hour, minute, second) +
               (utc ? "+00:00" : "");
    }

    bool CaptureDate::operator==(const CaptureDate &o) const
    {
        return year == o.year && month == o.month && day == o.day &&
               hour == o.hour && minute == o.minute && second == o.second &&
               utc == o.utc;
    }

    std::ostream &operator<<(std::ostream &os, const CaptureDate &d)
    {
        os << d.toIsoString();
        return os;
    }

}
