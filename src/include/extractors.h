/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef EXTRACTORS_H
#define EXTRACTORS_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fs.h"
#include "capturedate.h"
#include "coordinates.h"
#include "exif.h"

namespace mtd {

// What a single source knows about a file
struct Extraction {
    std::optional<CaptureDate> date;
    std::optional<DMSCoordinates> location;

    Extraction() {}
    Extraction(const std::optional<CaptureDate> &date, const std::optional<DMSCoordinates> &location) : date(date), location(location) {}
};

// Per-file state shared by the extractors of one reconciliation
class ExtractContext {
    fs::path file;
    std::vector<std::string> nameFormats;
    std::unique_ptr<ExifContainer> container;
    bool containerOpened;

public:
    ExtractContext(const fs::path &file, const std::vector<std::string> &nameFormats) :
        file(file), nameFormats(nameFormats), containerOpened(false) {}

    const fs::path &getFile() const { return file; }
    const std::vector<std::string> &getNameFormats() const { return nameFormats; }

    // Opens the EXIF container on first use, nullptr if unavailable
    ExifContainer *getContainer();
    std::unique_ptr<ExifContainer> releaseContainer();
};

class Extractor {
public:
    virtual ~Extractor() {}

    virtual Extraction extract(ExtractContext &ctx) = 0;
    virtual std::string name() const = 0;
};

class ExifExtractor : public Extractor {
public:
    Extraction extract(ExtractContext &ctx) override;
    std::string name() const override { return "exif"; }
};

// Reads "<file>.json" sidecars as exported by photo services.
// Throws JSONException if the sidecar exists but is malformed.
class JsonExtractor : public Extractor {
public:
    Extraction extract(ExtractContext &ctx) override;
    std::string name() const override { return "json"; }

    static fs::path sidecarPath(const fs::path &file);
};

class FilenameExtractor : public Extractor {
public:
    Extraction extract(ExtractContext &ctx) override;
    std::string name() const override { return "filename"; }

    // Tries each strptime format against the beginning of the file stem
    static std::optional<CaptureDate> parseName(const std::string &stem, const std::vector<std::string> &formats);
};

typedef std::function<Extractor *(const std::string &name)> ExtractorLookup;

// @return the extractor registered under name (case insensitive), or nullptr
Extractor *getExtractor(const std::string &name);

std::vector<std::string> getExtractorNames();

}

#endif // EXTRACTORS_H
