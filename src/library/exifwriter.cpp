/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "exifwriter.h"

#include <exiv2/exiv2.hpp>
#include "exceptions.h"
#include "logger.h"
#include "mio.h"

namespace mtd {

void applyMetadata(ReconciledMetadata &meta) {
    if (!meta.container) return;

    if (meta.date) {
        meta.container->writeDate(*meta.date);
    }

    if (meta.location) {
        try {
            meta.container->writeLocation(*meta.location);
        } catch (const ExifException &e) {
            LOGW << "Cannot set location: " << e.what();
        } catch (const Exiv2::Error &e) {
            LOGW << "Cannot set location: " << e.what();
        }
    }
}

std::vector<uint8_t> outputBytes(ReconciledMetadata &meta, const fs::path &inputFile) {
    if (!meta.container) return io::readFile(inputFile);
    if (!meta.container->isModified()) return meta.container->originalData();

    try {
        return meta.container->serialize();
    } catch (const Exiv2::Error &e) {
        LOGW << "Cannot write metadata for " << inputFile.string() << ": " << e.what();
    } catch (const ExifException &e) {
        LOGW << "Cannot write metadata for " << inputFile.string() << ": " << e.what();
    }

    return meta.container->originalData();
}

void writeMetadata(ReconciledMetadata &meta, const fs::path &inputFile, const fs::path &outputFile) {
    applyMetadata(meta);

    io::writeFile(outputFile, outputBytes(meta, inputFile));

    if (meta.date) {
        io::setFileTimes(outputFile, meta.date->toEpoch());
    }
}

}
