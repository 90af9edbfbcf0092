/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstdio>
#include <unistd.h>
#include "normalize.h"
#include "constants.h"
#include "exceptions.h"
#include "extractors.h"
#include "processor.h"
#include "utils.h"

namespace cmd {

void Normalize::setOptions(cxxopts::Options &opts) {
    opts
    .positional_help("IN OUT")
    .custom_help("IN OUT [-s STRATEGIES] [-n FORMATS]")
    .add_options()
    ("i,input", "Input directory", cxxopts::value<std::string>())
    ("o,output", "Output directory (created if missing)", cxxopts::value<std::string>())
    ("s,strategies", "Comma-separated search strategies, highest priority first (" + mtd::utils::join(mtd::getExtractorNames()) + ")", cxxopts::value<std::string>()->default_value(DEFAULT_STRATEGIES))
    ("n,name-formats", "Comma-separated file name formats for the 'filename' strategy", cxxopts::value<std::string>()->default_value(DEFAULT_NAME_FORMATS))
    ("x,skip-extensions", "Comma-separated extensions of files to ignore", cxxopts::value<std::string>()->default_value(DEFAULT_SKIP_EXTENSIONS))
    ("j,jobs", "Number of files to process in parallel", cxxopts::value<int>()->default_value("1"))
    ("k,keep-going", "Continue with the next files when a file fails", cxxopts::value<bool>())
    ("no-color", "Do not color the output", cxxopts::value<bool>());

    opts.parse_positional({"input", "output"});
}

std::string Normalize::description() {
    return "Photo metadata parser and applier.";
}

std::string Normalize::extendedDescription() {
    return "\n\nReads capture date and location of each file in IN from its EXIF data, "
           "its JSON sidecar (<file>.json) or its name, then writes a copy "
           "with the reconciled values to OUT.";
}

void Normalize::run(cxxopts::ParseResult &opts) {
    if (!opts.count("input") || !opts.count("output")) {
        printHelp(std::cerr, false);
        exit(EXIT_FAILURE);
    }

    mtd::ProcessOptions po;
    po.strategies = mtd::utils::parseList(opts["strategies"].as<std::string>());
    po.nameFormats = mtd::utils::parseList(opts["name-formats"].as<std::string>());
    po.skipExtensions = mtd::utils::parseList(opts["skip-extensions"].as<std::string>());
    po.jobs = opts["jobs"].as<int>();
    po.keepGoing = opts["keep-going"].count() > 0;
    po.color = opts["no-color"].count() == 0 && isatty(fileno(stdout));

    if (po.jobs < 1) throw mtd::InvalidArgsException("jobs must be at least 1");

    auto summary = mtd::processDirectory(opts["input"].as<std::string>(),
                                         opts["output"].as<std::string>(),
                                         po);

    if (summary.failed > 0) {
        std::cerr << summary.failed << " file(s) failed" << std::endl;
        exit(EXIT_FAILURE);
    }
}

}
