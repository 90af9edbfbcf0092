/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "coordinates.h"

#include <cctype>
#include <cmath>

namespace mtd
{

    namespace
    {
        double dmsToDecimal(const DMS &dms, char negativeRef)
        {
            double value = dms.degrees + (dms.minutes / 60.0) + (dms.seconds / 3600.0);
            if (std::toupper(static_cast<unsigned char>(dms.ref)) == negativeRef)
                value = -value;
            return value;
        }

        DMS decimalToDMS(double d, char positiveRef, char negativeRef)
        {
            const char ref = d >= 0.0 ? positiveRef : negativeRef;
            const double a = std::fabs(d);
            const int degrees = static_cast<int>(a);
            const double fracMinutes = (a - degrees) * 60.0;
            const int minutes = static_cast<int>(fracMinutes);
            const double seconds = (fracMinutes - minutes) * 60.0;

            return DMS(degrees, minutes, seconds, ref);
        }
    }

    DecimalCoordinates toDecimal(const DMSCoordinates &coords)
    {
        return DecimalCoordinates(dmsToDecimal(coords.latitude, 'S'),
                                  dmsToDecimal(coords.longitude, 'W'));
    }

    DMSCoordinates toDMS(const DecimalCoordinates &coords)
    {
        return DMSCoordinates(decimalToDMS(coords.latitude, 'N', 'S'),
                              decimalToDMS(coords.longitude, 'E', 'W'));
    }

    std::ostream &operator<<(std::ostream &os, const DecimalCoordinates &c)
    {
        os << "(" << c.latitude << ", " << c.longitude << ")";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, const DMS &d)
    {
        os << d.degrees << "deg " << d.minutes << "' " << d.seconds << "\" " << d.ref;
        return os;
    }

    std::ostream &operator<<(std::ostream &os, const DMSCoordinates &c)
    {
        os << c.latitude << " " << c.longitude;
        return os;
    }

}
