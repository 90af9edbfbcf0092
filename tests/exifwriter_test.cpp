/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "gtest/gtest.h"
#include "exifwriter.h"
#include "mio.h"
#include "test.h"
#include "testarea.h"
#include "testimage.h"

namespace {

using namespace mtd;

TEST(outputBytes, NoContainer) {
    TestArea ta(TEST_NAME, true);
    const fs::path p = ta.getPath("data.bin");
    writeTextFile(p, "some bytes");

    ReconciledMetadata meta;
    meta.date = CaptureDate(2023, 1, 1, 12, 0, 0);
    applyMetadata(meta);
    EXPECT_EQ(outputBytes(meta, p), io::readFile(p));
}

TEST(outputBytes, UnmodifiedContainer) {
    TestArea ta(TEST_NAME, true);
    const fs::path p = ta.getPath("exif.jpg");
    createJpeg(p, {{"Exif.Image.Make", "Test"}});

    ReconciledMetadata meta;
    meta.container = ExifContainer::open(p);
    ASSERT_TRUE(meta.container != nullptr);

    applyMetadata(meta);
    EXPECT_FALSE(meta.container->isModified());
    EXPECT_EQ(outputBytes(meta, p), io::readFile(p));
}

TEST(writeMetadata, DateAndLocation) {
    TestArea ta(TEST_NAME, true);
    const fs::path in = ta.getPath("in.jpg");
    const fs::path out = ta.getPath("out.jpg");
    createJpeg(in, {{"Exif.Image.Make", "Test"}});

    ReconciledMetadata meta;
    meta.container = ExifContainer::open(in);
    meta.date = CaptureDate::fromEpoch(1000000000, true);
    meta.location = toDMS(DecimalCoordinates(40.7128, -74.0060));
    writeMetadata(meta, in, out);

    auto exif = readExif(out);
    EXPECT_EQ(exif["Exif.Image.DateTime"].toString(), "2001:09:09 01:46:40");
    EXPECT_EQ(exif["Exif.GPSInfo.GPSLatitudeRef"].toString(), "N");
    EXPECT_EQ(exif["Exif.GPSInfo.GPSLongitudeRef"].toString(), "W");
    EXPECT_EQ(exif["Exif.Image.Make"].toString(), "Test");

    EXPECT_EQ(io::Path(out).getModifiedTime(), 1000000000);
    EXPECT_EQ(io::Path(out).getAccessTime(), 1000000000);
}

TEST(writeMetadata, LocationTypeMismatchKeepsDate) {
    TestArea ta(TEST_NAME, true);
    const fs::path in = ta.getPath("in.jpg");
    const fs::path out = ta.getPath("out.jpg");

    Exiv2::ExifData exifData;
    exifData["Exif.Image.Make"] = "Test";
    Exiv2::AsciiValue v("N");
    exifData.add(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitude"), &v);
    createJpeg(in, exifData);

    ReconciledMetadata meta;
    meta.container = ExifContainer::open(in);
    ASSERT_TRUE(meta.container != nullptr);
    meta.date = CaptureDate(2023, 1, 1, 12, 0, 0);
    meta.location = toDMS(DecimalCoordinates(1.0, 2.0));

    EXPECT_NO_THROW(writeMetadata(meta, in, out));

    auto exif = readExif(out);
    EXPECT_EQ(exif["Exif.Image.DateTime"].toString(), "2023:01:01 12:00:00");
    EXPECT_TRUE(exif.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitude")) == exif.end());
    EXPECT_EQ(io::Path(out).getModifiedTime(), CaptureDate(2023, 1, 1, 12, 0, 0).toEpoch());
}

}
