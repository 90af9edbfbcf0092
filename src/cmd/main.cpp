/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstring>
#include <iostream>

#include "normalize.h"
#include "logger.h"
#include "exceptions.h"
#include "metadater.h"

using namespace std;
using namespace mtd;

bool hasParam(int argc, char *argv[], const char* param) {
    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], param) == 0) return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    MTDRegisterProcess(hasParam(argc, argv, "--debug"));

    if (hasParam(argc, argv, "--version")) {
        std::cout << MTDGetVersion() << std::endl;
        return 0;
    }

    try {
        cmd::Normalize normalize;
        cmd::Command *command = &normalize;
        command->run(argc, argv);
    } catch (const AppException &exception) {
        std::cerr << exception.what() << std::endl;
        return 1;
    }

    return 0;
}
