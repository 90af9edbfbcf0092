/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef TESTAREA_H
#define TESTAREA_H

#include <string>
#include "fs.h"

class TestArea
{
    std::string name;
    fs::path root() const;
public:
    TestArea(const std::string &name, bool recreateIfExists = false);

    fs::path getPath(const fs::path &p);
    fs::path getFolder(const fs::path &subfolder = "");

    static void clearAll();
};

#endif // TESTAREA_H
