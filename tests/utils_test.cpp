/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "gtest/gtest.h"
#include "exceptions.h"
#include "mio.h"
#include "utils.h"
#include "test.h"
#include "testarea.h"

namespace {

using namespace mtd;

TEST(parseInt64, Valid) {
    int64_t v = 0;
    EXPECT_TRUE(utils::parseInt64("1672574400000", v));
    EXPECT_EQ(v, 1672574400000LL);
    EXPECT_TRUE(utils::parseInt64("-42", v));
    EXPECT_EQ(v, -42);
}

TEST(parseInt64, Invalid) {
    int64_t v = 7;
    EXPECT_FALSE(utils::parseInt64("", v));
    EXPECT_FALSE(utils::parseInt64("12a", v));
    EXPECT_FALSE(utils::parseInt64(" 12", v));
    EXPECT_FALSE(utils::parseInt64("2023:01:01 12:00:00", v));
    EXPECT_FALSE(utils::parseInt64("99999999999999999999", v));
    EXPECT_EQ(v, 7);
}

TEST(parseList, TrimsAndDropsEmpty) {
    auto l = utils::parseList(" exif, json ,,filename ");
    ASSERT_EQ(l.size(), 3u);
    EXPECT_EQ(l[0], "exif");
    EXPECT_EQ(l[1], "json");
    EXPECT_EQ(l[2], "filename");

    EXPECT_TRUE(utils::parseList("").empty());
    EXPECT_EQ(utils::join(l), "exif,json,filename");
}

TEST(Path, checkExtension) {
    EXPECT_TRUE(io::Path("a/b.JSON").checkExtension({"json", "gif"}));
    EXPECT_TRUE(io::Path("b.gif").checkExtension({"json", ".gif"}));
    EXPECT_FALSE(io::Path("b.jpg").checkExtension({"json", "gif"}));
    EXPECT_FALSE(io::Path("noext").checkExtension({"json", "gif"}));
}

TEST(Path, isHidden) {
    EXPECT_TRUE(io::Path("dir/.hidden.jpg").isHidden());
    EXPECT_FALSE(io::Path(".dir/visible.jpg").isHidden());
}

TEST(mio, writeReadSetTimes) {
    TestArea ta(TEST_NAME, true);
    const fs::path p = ta.getPath("data.bin");

    std::vector<uint8_t> data = {0, 1, 2, 255, 0, 10};
    io::writeFile(p, data);
    EXPECT_EQ(io::readFile(p), data);
    EXPECT_FALSE(fs::exists(ta.getPath("data.bin.tmp")));

    io::setFileTimes(p, 1000000000);
    EXPECT_EQ(io::Path(p).getModifiedTime(), 1000000000);
    EXPECT_EQ(io::Path(p).getAccessTime(), 1000000000);

    EXPECT_THROW(io::readFile(ta.getPath("missing.bin")), FSException);
    EXPECT_THROW(io::setFileTimes(ta.getPath("missing.bin"), 0), FSException);
}

TEST(mio, writeFileKeepsOtherFiles) {
    TestArea ta(TEST_NAME, true);
    const fs::path p = ta.getPath("a.jpg");
    const fs::path other = ta.getPath("a.jpg.tmp");
    const std::vector<uint8_t> userData = {'U', 'S', 'E', 'R'};
    io::writeFile(other, userData);

    io::writeFile(p, {'x'});
    io::writeFile(p, {'y', 'z'});

    EXPECT_EQ(io::readFile(p), std::vector<uint8_t>({'y', 'z'}));
    ASSERT_TRUE(fs::exists(other));
    EXPECT_EQ(io::readFile(other), userData);

    // No temporary files left behind
    int count = 0;
    for (auto &entry : fs::directory_iterator(ta.getFolder())) {
        (void)entry;
        count++;
    }
    EXPECT_EQ(count, 2);
}

}
