/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "extractors.h"

#include <ctime>
#include <fstream>
#include <map>
#include "constants.h"
#include "exceptions.h"
#include "json.h"
#include "logger.h"
#include "utils.h"

namespace mtd {

ExifContainer *ExtractContext::getContainer() {
    if (!containerOpened) {
        containerOpened = true;

        try {
            container = ExifContainer::open(file);
        } catch (const FSException &e) {
            LOGD << e.what();
            container = nullptr;
        }

        if (!container) LOGD << "No usable EXIF container in " << file.string();
    }

    return container.get();
}

std::unique_ptr<ExifContainer> ExtractContext::releaseContainer() {
    return std::move(container);
}

Extraction ExifExtractor::extract(ExtractContext &ctx) {
    ExifContainer *container = ctx.getContainer();
    if (container == nullptr || !container->hasExif()) return Extraction();

    return Extraction(container->readDate(), container->readLocation());
}

fs::path JsonExtractor::sidecarPath(const fs::path &file) {
    fs::path p = file;
    p += SIDECAR_EXTENSION;
    return p;
}

Extraction JsonExtractor::extract(ExtractContext &ctx) {
    const fs::path sidecar = sidecarPath(ctx.getFile());
    if (!fs::exists(sidecar)) return Extraction();

    LOGD << "Reading " << sidecar.string();

    std::ifstream in(sidecar);
    if (!in.is_open()) throw JSONException("Cannot open " + sidecar.string());

    int64_t timestamp;
    double latitude, longitude;

    try {
        const json j = json::parse(in);

        const json &ts = j.at("photoTakenTime").at("timestamp");
        if (ts.is_string()) {
            if (!utils::parseInt64(ts.get<std::string>(), timestamp))
                throw JSONException("Invalid photoTakenTime.timestamp in " + sidecar.string() + ": " + ts.get<std::string>());
        } else if (ts.is_number_integer()) {
            timestamp = ts.get<int64_t>();
        } else {
            throw JSONException("Invalid photoTakenTime.timestamp in " + sidecar.string());
        }

        const json &geo = j.at("geoData");
        latitude = geo.at("latitude").get<double>();
        longitude = geo.at("longitude").get<double>();
    } catch (const json::exception &e) {
        throw JSONException("Invalid sidecar " + sidecar.string() + ": " + e.what());
    }

    Extraction res;
    try {
        res.date = CaptureDate::fromEpoch(static_cast<time_t>(timestamp), true);
    } catch (const InvalidArgsException &e) {
        throw JSONException("Invalid sidecar " + sidecar.string() + ": " + e.what());
    }

    // (0, 0) is how exports say "no location"
    if (latitude != SIDECAR_NO_GPS_LATITUDE || longitude != SIDECAR_NO_GPS_LONGITUDE) {
        res.location = toDMS(DecimalCoordinates(latitude, longitude));
    }

    return res;
}

Extraction FilenameExtractor::extract(ExtractContext &ctx) {
    return Extraction(parseName(ctx.getFile().stem().string(), ctx.getNameFormats()), std::nullopt);
}

std::optional<CaptureDate> FilenameExtractor::parseName(const std::string &stem, const std::vector<std::string> &formats) {
    // The length of a formatted date tells how much of the stem to look at
    const time_t now = time(nullptr);
    std::tm today{};
    localtime_r(&now, &today);

    for (auto &format : formats) {
        if (format.empty()) continue;

        char buf[256];
        const size_t len = strftime(buf, sizeof(buf), format.c_str(), &today);
        if (len == 0) {
            LOGD << "Cannot use file name format " << format;
            continue;
        }

        auto date = CaptureDate::parse(stem.substr(0, len), format);
        if (date) return date;
    }

    return std::nullopt;
}

namespace {

std::map<std::string, std::shared_ptr<Extractor>> &registry() {
    static std::map<std::string, std::shared_ptr<Extractor>> extractors = {
        {"exif", std::make_shared<ExifExtractor>()},
        {"json", std::make_shared<JsonExtractor>()},
        {"filename", std::make_shared<FilenameExtractor>()}
    };
    return extractors;
}

}

Extractor *getExtractor(const std::string &name) {
    std::string key = name;
    utils::trim(key);
    utils::toLower(key);

    auto it = registry().find(key);
    if (it == registry().end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> getExtractorNames() {
    std::vector<std::string> names;
    for (auto &it : registry()) names.push_back(it.first);
    return names;
}

}
