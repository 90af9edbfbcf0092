/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "metadater.h"

#include <exiv2/exiv2.hpp>

#include <cstdlib>
#include <iostream>
#include <mutex>

#include "constants.h"
#include "logger.h"
#include "utils.h"

static std::once_flag initialization_flag;

void exiv2LogHandler(int level, const char* msg) {
    std::string s(msg != nullptr ? msg : "");
    mtd::utils::rtrim(s);

    if (level >= Exiv2::LogMsg::error) {
        LOGD << "Exiv2 error: " << s;
    } else {
        LOGV << "Exiv2: " << s;
    }
}

void setupLogging(bool verbose) {
    try {
        const auto logToFile = std::getenv(MTD_LOG_ENV) != nullptr;

        // Enable verbose logging if the environment variable is set
        bool enableVerbose = verbose || std::getenv(MTD_DEBUG_ENV) != nullptr;

        init_logger(logToFile);
        if (enableVerbose || logToFile) {
            set_logger_verbose();
        }

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    }
}

void setupExiv2() {
    // Exiv2 writes warnings to stderr by default, route them to our log
    Exiv2::LogMsg::setHandler(exiv2LogHandler);
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::warn);

    // Must happen before any thread touches XMP data
    Exiv2::XmpParser::initialize();
}

void MTDRegisterProcess(bool verbose) {
    std::call_once(initialization_flag, [verbose]() {
        setupLogging(verbose);
        setupExiv2();

        LOGD << "metadater v" << MTDGetVersion();
        LOGD << "Exiv2 version: " << Exiv2::versionString();
    });
}

const char* MTDGetVersion() {
    return APP_VERSION;
}
