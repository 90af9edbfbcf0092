/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef RECONCILER_H
#define RECONCILER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fs.h"
#include "capturedate.h"
#include "coordinates.h"
#include "exif.h"
#include "extractors.h"

namespace mtd {

struct ReconciledMetadata {
    std::optional<CaptureDate> date;
    std::optional<DMSCoordinates> location;

    // Container opened while extracting, reused for writing (may be null)
    std::unique_ptr<ExifContainer> container;
};

// Whether a file should produce no output at all: non regular files,
// hidden files and files with one of the given extensions
bool shouldSkip(const fs::path &file, const std::vector<std::string> &skipExtensions);

/**
 * @brief Merges what each strategy knows about a file.
 *
 * Strategies are run from last to first; every value found overwrites
 * the current one, so the first strategy in the list has the highest
 * priority. Missing values never overwrite. Unknown strategies are ignored.
 */
ReconciledMetadata reconcile(const fs::path &file,
                             const std::vector<std::string> &strategies,
                             const std::vector<std::string> &nameFormats,
                             const ExtractorLookup &lookup = getExtractor);

}

#endif // RECONCILER_H
