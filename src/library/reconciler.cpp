/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "reconciler.h"

#include "logger.h"
#include "mio.h"

namespace mtd {

bool shouldSkip(const fs::path &file, const std::vector<std::string> &skipExtensions) {
    std::error_code e;
    if (!fs::is_regular_file(file, e)) return true;

    io::Path p(file);
    return p.isHidden() || p.checkExtension(skipExtensions);
}

ReconciledMetadata reconcile(const fs::path &file,
                             const std::vector<std::string> &strategies,
                             const std::vector<std::string> &nameFormats,
                             const ExtractorLookup &lookup) {
    ReconciledMetadata res;
    ExtractContext ctx(file, nameFormats);

    // Last to first, so that earlier strategies overwrite later ones
    for (auto it = strategies.rbegin(); it != strategies.rend(); it++) {
        Extractor *extractor = lookup(*it);
        if (extractor == nullptr) {
            LOGD << "Ignoring unknown strategy '" << *it << "'";
            continue;
        }

        Extraction e = extractor->extract(ctx);
        LOGD << file.filename().string() << " [" << extractor->name() << "] "
             << "date: " << (e.date ? e.date->toIsoString() : "none") << ", "
             << "location: " << (e.location ? "found" : "none");

        if (e.date) res.date = e.date;
        if (e.location) res.location = e.location;
    }

    res.container = ctx.releaseContainer();
    return res;
}

}
