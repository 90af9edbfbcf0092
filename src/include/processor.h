/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PROCESSOR_H
#define PROCESSOR_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "fs.h"
#include "capturedate.h"
#include "coordinates.h"

namespace mtd {

struct ProcessOptions {
    std::vector<std::string> strategies;
    std::vector<std::string> nameFormats;
    std::vector<std::string> skipExtensions;
    int jobs;
    bool keepGoing;
    bool color;

    ProcessOptions();
};

struct FileReport {
    std::string fileName;
    bool skipped = false;
    std::optional<CaptureDate> date;
    std::optional<DMSCoordinates> location;
    std::string error;

    bool failed() const { return !error.empty(); }
};

struct ProcessSummary {
    size_t processed = 0;
    size_t skipped = 0;
    size_t failed = 0;
};

// Reconciles a single file and writes it to outDir/<name>.
// Sidecar errors propagate as JSONException.
FileReport processFile(const fs::path &inFile, const fs::path &outDir, const ProcessOptions &opts);

// "<name> =>\t<date>, <location>"
std::string formatReport(const FileReport &report, bool color);

/**
 * @brief Processes every file directly inside inDir.
 *
 * Throws FSException if inDir is missing or not a directory, or if outDir
 * exists and is not a directory. outDir is created if needed. A failing
 * file aborts the run unless opts.keepGoing is set.
 */
ProcessSummary processDirectory(const fs::path &inDir, const fs::path &outDir, const ProcessOptions &opts);

}

#endif // PROCESSOR_H
