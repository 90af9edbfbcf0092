/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef EXIFWRITER_H
#define EXIFWRITER_H

#include <cstdint>
#include <vector>
#include "fs.h"
#include "reconciler.h"

namespace mtd {

// Sets the reconciled date and location into the container (if any).
// GPS write failures are logged and ignored.
void applyMetadata(ReconciledMetadata &meta);

// Bytes of the output file: the serialized container if it was modified,
// the input file otherwise
std::vector<uint8_t> outputBytes(ReconciledMetadata &meta, const fs::path &inputFile);

// Applies, writes outputFile and sets its timestamps to the capture date
void writeMetadata(ReconciledMetadata &meta, const fs::path &inputFile, const fs::path &outputFile);

}

#endif // EXIFWRITER_H
