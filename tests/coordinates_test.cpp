/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include <sstream>
#include "gtest/gtest.h"
#include "coordinates.h"
#include "test.h"

namespace {

using namespace mtd;

TEST(toDMS, Hemispheres) {
    auto dms = toDMS(DecimalCoordinates(45.5, -73.25));
    EXPECT_EQ(dms.latitude.degrees, 45);
    EXPECT_EQ(dms.latitude.minutes, 30);
    EXPECT_NEAR(dms.latitude.seconds, 0.0, 1e-9);
    EXPECT_EQ(dms.latitude.ref, 'N');
    EXPECT_EQ(dms.longitude.degrees, 73);
    EXPECT_EQ(dms.longitude.minutes, 15);
    EXPECT_NEAR(dms.longitude.seconds, 0.0, 1e-9);
    EXPECT_EQ(dms.longitude.ref, 'W');

    dms = toDMS(DecimalCoordinates(-33.8688, 151.2093));
    EXPECT_EQ(dms.latitude.ref, 'S');
    EXPECT_EQ(dms.longitude.ref, 'E');
    EXPECT_EQ(dms.latitude.degrees, 33);
    EXPECT_EQ(dms.latitude.minutes, 52);
    EXPECT_NEAR(dms.latitude.seconds, 7.68, 1e-6);
}

TEST(toDecimal, Signs) {
    auto d = toDecimal(DMSCoordinates(DMS(10, 30, 0, 'S'), DMS(20, 15, 36, 'W')));
    EXPECT_DOUBLE_EQ(d.latitude, -10.5);
    EXPECT_DOUBLE_EQ(d.longitude, -20.26);

    d = toDecimal(DMSCoordinates(DMS(10, 30, 0, 'n'), DMS(20, 15, 36, 'e')));
    EXPECT_DOUBLE_EQ(d.latitude, 10.5);
    EXPECT_DOUBLE_EQ(d.longitude, 20.26);
}

TEST(toDecimal, RoundTrip) {
    const double values[][2] = {
        {0.0, 0.0},
        {40.7128, -74.0060},
        {-89.999999, 179.999999},
        {89.123456, -179.654321},
        {-0.000277, 0.000277},
        {51.477928, -0.001545}
    };

    for (auto &v : values) {
        auto d = toDecimal(toDMS(DecimalCoordinates(v[0], v[1])));
        EXPECT_NEAR(d.latitude, v[0], 1e-9);
        EXPECT_NEAR(d.longitude, v[1], 1e-9);
    }
}

TEST(toDMS, OutOfRangeNotClamped) {
    auto dms = toDMS(DecimalCoordinates(95.0, -200.0));
    EXPECT_EQ(dms.latitude.degrees, 95);
    EXPECT_EQ(dms.longitude.degrees, 200);
    EXPECT_EQ(dms.longitude.ref, 'W');
}

TEST(DMSCoordinates, Print) {
    std::ostringstream os;
    os << DMSCoordinates(DMS(1, 2, 3, 'N'), DMS(4, 5, 6, 'E'));
    EXPECT_EQ(os.str(), "1deg 2' 3\" N 4deg 5' 6\" E");
}

}
