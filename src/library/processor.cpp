/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "processor.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>
#include "constants.h"
#include "exceptions.h"
#include "exifwriter.h"
#include "logger.h"
#include "mio.h"
#include "reconciler.h"
#include "utils.h"

namespace mtd {

namespace {

std::string esc(int code) {
    return "\033[" + std::to_string(code) + "m";
}

std::string paint(const std::string &text, int code, bool color) {
    if (!color) return text;
    return esc(code) + text + esc(0);
}

}

ProcessOptions::ProcessOptions() :
    strategies(utils::parseList(DEFAULT_STRATEGIES)),
    nameFormats(utils::parseList(DEFAULT_NAME_FORMATS)),
    skipExtensions(utils::parseList(DEFAULT_SKIP_EXTENSIONS)),
    jobs(1), keepGoing(false), color(false) {}

FileReport processFile(const fs::path &inFile, const fs::path &outDir, const ProcessOptions &opts) {
    FileReport report;
    report.fileName = inFile.filename().string();

    if (shouldSkip(inFile, opts.skipExtensions)) {
        report.skipped = true;
        return report;
    }

    auto meta = reconcile(inFile, opts.strategies, opts.nameFormats);
    report.date = meta.date;
    report.location = meta.location;

    writeMetadata(meta, inFile, outDir / inFile.filename());

    return report;
}

std::string formatReport(const FileReport &report, bool color) {
    std::ostringstream os;
    os << (color ? esc(1) + esc(96) + report.fileName + esc(0) : report.fileName) << " =>\t";

    if (report.failed()) {
        os << paint("failed: " + report.error, 91, color);
        return os.str();
    }

    if (report.date) os << paint(report.date->toIsoString(), 92, color);
    else os << paint("no date", 91, color);

    os << ", ";

    if (report.location) {
        std::ostringstream loc;
        loc << toDecimal(*report.location);
        os << paint(loc.str(), 92, color);
    } else {
        os << paint("no location", 91, color);
    }

    return os.str();
}

ProcessSummary processDirectory(const fs::path &inDir, const fs::path &outDir, const ProcessOptions &opts) {
    if (!fs::exists(inDir)) throw FSException("Input directory does not exist");
    if (!fs::is_directory(inDir)) throw FSException("Input is not a directory");
    if (fs::exists(outDir) && !fs::is_directory(outDir)) throw FSException("Output is not a directory");

    io::createDirectories(outDir);

    std::vector<fs::path> files;
    try {
        for (auto &entry : fs::directory_iterator(inDir)) files.push_back(entry.path());
    } catch (const fs::filesystem_error &e) {
        throw FSException("Cannot list " + inDir.string() + ": " + e.what());
    }
    std::sort(files.begin(), files.end());

    LOGD << "Found " << files.size() << " entries in " << inDir.string();
    LOGD << "Strategies: " << utils::join(opts.strategies) << " | Name formats: " << utils::join(opts.nameFormats);

    std::atomic<size_t> next(0), processed(0), skipped(0), failed(0);
    std::atomic<bool> aborted(false);
    std::exception_ptr firstError;
    std::mutex errorMutex;

    // Returns true if the run must stop
    auto onError = [&](const fs::path &f, FileReport &report, std::exception_ptr ex, const std::string &msg) {
        if (!opts.keepGoing) {
            std::lock_guard<std::mutex> lock(errorMutex);
            if (!firstError) firstError = ex;
            aborted = true;
            return true;
        }

        report.fileName = f.filename().string();
        report.error = msg;
        return false;
    };

    auto worker = [&]() {
        while (!aborted) {
            const size_t i = next++;
            if (i >= files.size()) break;

            const fs::path &f = files[i];
            FileReport report;

            try {
                report = processFile(f, outDir, opts);
            } catch (const AppException &e) {
                if (onError(f, report, std::current_exception(), e.what())) break;
            } catch (const std::exception &e) {
                const std::string msg = f.filename().string() + ": " + e.what();
                if (onError(f, report, std::make_exception_ptr(AppException(msg)), e.what())) break;
            }

            if (report.skipped) {
                LOGD << "Skipping " << f.string();
                skipped++;
            } else if (report.failed()) {
                LOGE << formatReport(report, opts.color);
                failed++;
            } else {
                LOGI << formatReport(report, opts.color);
                processed++;
            }
        }
    };

    const size_t jobs = std::min(static_cast<size_t>(std::max(opts.jobs, 1)), std::max(files.size(), static_cast<size_t>(1)));
    if (jobs == 1) {
        worker();
    } else {
        LOGD << "Using " << jobs << " workers";

        std::vector<std::thread> workers;
        for (size_t i = 0; i < jobs; i++) workers.emplace_back(worker);
        for (auto &t : workers) t.join();
    }

    if (firstError) std::rethrow_exception(firstError);

    ProcessSummary summary;
    summary.processed = processed;
    summary.skipped = skipped;
    summary.failed = failed;

    LOGD << "Processed: " << summary.processed << " | Skipped: " << summary.skipped << " | Failed: " << summary.failed;

    return summary;
}

}
