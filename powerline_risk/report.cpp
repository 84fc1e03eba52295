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
#include "report.hpp"
#include <fstream>    // for ofstream
#include <iomanip>    // for setprecision
#include <map>        // for map
#include <ostream>    // for ostream, operator<<
#include <set>        // for set
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <variant>    // for get_if

#include "risk_policy.hpp"

using std::string;
using std::ostream;
using std::ofstream;
using std::fixed;
using std::setprecision;
using std::map;
using std::set;
using std::runtime_error;

using proximity::DetectionResult;
using proximity::HitSource;
using proximity::SegmentSource;
using infra::InfraPoint;

namespace report {

// Display name of whatever caused a hit
string sourceLabel(const HitSource& source) {
    if (const auto* obj = std::get_if<InfraPoint>(&source)) return risk::kindName(obj->kind);
    return POWER_LINE_LABEL;
}

// Writes one CSV row per hit
//
// Args:
//    out: stream to write to
//    result: detection result
void writeHitsCsv(ostream& out, const DetectionResult& result) {
    out << "residential_id,residential_lat,residential_lon,source_type,source_id,segment,distance_m\n";
    for (const auto& hit : result.hits) {
        out << hit.residential.id << ","
            << fixed << setprecision(7) << hit.residential.lat << ","
            << hit.residential.lon << ","
            // Quote label in case of commas
            << "\"" << sourceLabel(hit.source) << "\",";
        if (const auto* seg = std::get_if<SegmentSource>(&hit.source)) {
            out << seg->lineId << "," << seg->segmentIndex << ",";
        } else {
            out << std::get<InfraPoint>(hit.source).id << ",,";
        }
        out << setprecision(2) << hit.distanceM << "\n";
    }
}

void writeHitsCsvFile(const string& path, const DetectionResult& result) {
    ofstream out(path);
    if (!out) throw runtime_error("Failed to open CSV for writing: " + path);
    writeHitsCsv(out, result);
}

// Human readable totals for the console
void summarize(ostream& out, const DetectionResult& result) {
    set<infra::ElementId> atRisk;
    map<string, size_t> perSource;
    for (const auto& hit : result.hits) {
        atRisk.insert(hit.residential.id);
        ++perSource[sourceLabel(hit.source)];
    }

    out << "Power objects: " << result.pointObjects.size() << "\n"
        << "Power lines: " << result.lines.size() << "\n"
        << "Proximity hits: " << result.hits.size() << "\n"
        << "Residential points at risk: " << atRisk.size() << "\n";
    for (const auto& kv : perSource) {
        out << "  " << kv.first << ": " << kv.second << "\n";
    }
}

}  // namespace report
