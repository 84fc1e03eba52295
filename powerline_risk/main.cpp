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

// main.cpp

// 1. Project headers
#include "config.hpp"
#include "geodesy.hpp"
#include "infrastructure.hpp"
#include "overpass.hpp"
#include "proximity.hpp"
#include "report.hpp"
#include "utils.hpp"

// 2. C++ system headers
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::exception;
using std::unique_ptr;

using config::Args;
using infra::InfraLine;
using infra::ResidentialPoint;
using overpass::PowerData;
using proximity::DetectionResult;
using proximity::ProximityEngine;

// Entry point
int main(int argc, char** argv) {
    Args args;
    if (!config::parseArgs(argc, argv, &args)) {
        config::usage(argv[0]);
        return 1;
    }

    try {
        // 1) Load power infrastructure and residential buildings
        PowerData power;
        vector<ResidentialPoint> residentials;
        if (args.powerJson) {
            cerr << "[info] Reading " << *args.powerJson << " and " << *args.buildingsJson << "\n";
            power = overpass::loadPowerFile(*args.powerJson);
            residentials = overpass::loadBuildingsFile(*args.buildingsJson);
        } else {
            utils::CurlHttpClient client(args.timeoutSeconds);
            cerr << "[info] Querying " << args.endpoint << " for area \"" << args.area << "\" ...\n";
            power = overpass::fetchPowerObjects(client, args.endpoint, args.area, args.categories);
            // no categories means a plain city lookup, nothing to check buildings against
            if (!args.categories.empty()) {
                residentials = overpass::fetchBuildings(client, args.endpoint, args.area);
            }
        }
        const vector<InfraLine> lines = overpass::resolveLines(power.ways, power.nodes);

        // 2) Detect residential points near infrastructure
        unique_ptr<geodesy::DistanceEvaluator> evaluator = geodesy::makeDistanceEvaluator(args.distance);
        ProximityEngine engine(*evaluator, args.pad);
        const DetectionResult result = engine.run(power.pointObjects, lines, residentials);
        cerr << "[info] Scanned " << result.pointObjects.size() << " power objects and "
             << result.stats.segmentsScanned << " line segments, "
             << result.stats.candidatesExamined << " candidates examined\n";

        // 3) Report
        report::summarize(cout, result);
        if (args.outCsv) {
            report::writeHitsCsvFile(*args.outCsv, result);
            cerr << "[info] Wrote hits CSV to " << *args.outCsv << "\n";
        }
    } catch (const exception& e) {
        cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
