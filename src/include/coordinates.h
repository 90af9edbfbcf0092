/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef COORDINATES_H
#define COORDINATES_H

#include <ostream>

namespace mtd
{

    struct DecimalCoordinates
    {
        double latitude;  // degrees, negative = south
        double longitude; // degrees, negative = west

        DecimalCoordinates() : latitude(0), longitude(0) {}
        DecimalCoordinates(double latitude, double longitude) : latitude(latitude), longitude(longitude) {}
    };

    // Degrees, minutes, seconds and hemisphere reference (N/S, E/W)
    struct DMS
    {
        int degrees;
        int minutes;
        double seconds;
        char ref;

        DMS() : degrees(0), minutes(0), seconds(0), ref('N') {}
        DMS(int degrees, int minutes, double seconds, char ref) : degrees(degrees), minutes(minutes), seconds(seconds), ref(ref) {}
    };

    struct DMSCoordinates
    {
        DMS latitude;
        DMS longitude;

        DMSCoordinates() : latitude(0, 0, 0, 'N'), longitude(0, 0, 0, 'E') {}
        DMSCoordinates(const DMS &latitude, const DMS &longitude) : latitude(latitude), longitude(longitude) {}
    };

    DecimalCoordinates toDecimal(const DMSCoordinates &coords);

    // Does not wrap or clamp out of range values
    DMSCoordinates toDMS(const DecimalCoordinates &coords);

    std::ostream &operator<<(std::ostream &os, const DecimalCoordinates &c);
    std::ostream &operator<<(std::ostream &os, const DMS &d);
    std::ostream &operator<<(std::ostream &os, const DMSCoordinates &c);

}

#endif // COORDINATES_H
