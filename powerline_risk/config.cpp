// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "config.hpp"
#include <cerrno>    // for errno, ERANGE
#include <cmath>     // for isfinite
#include <cstdlib>   // for strtod, strtol
#include <iostream>  // for cerr
#include <string>    // for string

using std::string;
using std::cerr;

using overpass::Category;

namespace config {

namespace {

bool parseDouble(const char* text, double* out) {
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE || !std::isfinite(value)) return false;
    *out = value;
    return true;
}

bool parseLong(const char* text, long* out) {
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return false;
    *out = value;
    return true;
}

}  // namespace

// Parses arguments from main entry point
//
// Args:
//    argc: number of arguments given
//    argv: provided arguments
//    out: pointer to the Args structure to set state on
// Returns:
//    false if help was asked for or the arguments are unusable
bool parseArgs(int argc, char** argv, Args* out) {
    for (int i = 1; i < argc; ++i) {
        string a(argv[i]);
        const bool hasValue = i + 1 < argc;
        if (a == "--area" && hasValue) {
            out->area = argv[++i];
        } else if (a == "--power-line") {
            out->categories.insert(Category::PowerLine);
        } else if (a == "--communication-tower") {
            out->categories.insert(Category::CommunicationTower);
        } else if (a == "--substation") {
            out->categories.insert(Category::Substation);
        } else if (a == "--transformer") {
            out->categories.insert(Category::Transformer);
        } else if (a == "--converter") {
            out->categories.insert(Category::Converter);
        } else if (a == "--all") {
            out->categories = {Category::PowerLine, Category::CommunicationTower,
                Category::Substation, Category::Transformer, Category::Converter};
        } else if (a == "--endpoint" && hasValue) {
            out->endpoint = argv[++i];
        } else if (a == "--power-json" && hasValue) {
            out->powerJson = argv[++i];
        } else if (a == "--buildings-json" && hasValue) {
            out->buildingsJson = argv[++i];
        } else if (a == "--pad" && hasValue) {
            if (!parseDouble(argv[++i], &out->pad) || out->pad < 0.0) {
                cerr << "[error] --pad expects a non-negative number of degrees\n";
                return false;
            }
        } else if (a == "--distance" && hasValue) {
            out->distance = argv[++i];
            if (out->distance != geodesy::GEODESIC && out->distance != geodesy::HAVERSINE) {
                cerr << "[error] --distance expects geodesic or haversine\n";
                return false;
            }
        } else if (a == "--timeout" && hasValue) {
            if (!parseLong(argv[++i], &out->timeoutSeconds) || out->timeoutSeconds < 0) {
                cerr << "[error] --timeout expects a non-negative number of seconds\n";
                return false;
            }
        } else if (a == "--out" && hasValue) {
            out->outCsv = argv[++i];
        } else if (a == "--help" || a == "-h") {
            return false;
        } else {
            cerr << "[error] Unknown or incomplete argument: " << a << "\n";
            return false;
        }
    }
    if (out->powerJson.has_value() != out->buildingsJson.has_value()) {
        cerr << "[error] --power-json and --buildings-json must be given together\n";
        return false;
    }
    return !out->area.empty();
}

// CLI usage message output as console error message
//
// Args:
//     exe: executable's name
void usage(const char* exe) {
    cerr << "Usage:\n"
         << "  " << exe << " [--area NAME] [--power-line] [--communication-tower]\n"
         << "      [--substation] [--transformer] [--converter] [--all]\n"
         << "      [--endpoint URL] [--timeout SECONDS]\n"
         << "      [--power-json FILE --buildings-json FILE]\n"
         << "      [--pad DEGREES] [--distance geodesic|haversine] [--out hits.csv]\n";
}

}  // namespace config
