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
#ifndef POWERLINE_RISK_PROXIMITY_HPP_
#define POWERLINE_RISK_PROXIMITY_HPP_

#include <stddef.h>  // for size_t
#include <variant>   // for variant
#include <vector>    // for vector

#include "geo_index.hpp"
#include "geodesy.hpp"
#include "infrastructure.hpp"

using std::vector;

namespace proximity {

// Margin added around every point object and segment before querying the
// index. 0.01 degrees of latitude is ~1.1 km, far above the largest threshold;
// the longitude margin shrinks with cos(lat) and is still ~190 m at 80 degrees.
const double BBOX_PAD_DEGREES = 0.01;

// segment of a power line that caused a hit
struct SegmentSource {
    infra::ElementId lineId{};
    // position of the line in DetectionResult::lines
    size_t lineIndex{};
    // segment i joins vertices i and i + 1
    size_t segmentIndex{};
};

using HitSource = std::variant<infra::InfraPoint, SegmentSource>;

// residential point within the risk threshold of an infrastructure object
struct ProximityHit {
    infra::ResidentialPoint residential;
    HitSource source;
    double distanceM{};
};

// counters collected during one run
struct RunStats {
    size_t droppedResidentials{};
    size_t droppedPointObjects{};
    size_t droppedLineVertices{};
    size_t segmentsScanned{};
    size_t candidatesExamined{};
};

// Output of one detection run. pointObjects and lines are the valid inputs,
// passed through for drawing regardless of hit status.
struct DetectionResult {
    vector<ProximityHit> hits;
    vector<infra::InfraPoint> pointObjects;
    vector<infra::InfraLine> lines;
    RunStats stats;
};

enum class EngineState { Idle, Indexed, Scanning, Done };

// Finds residential points near power infrastructure.
//
// A run indexes the residential points, then scans every point object and
// every line segment against the index. Candidates from the padded bounding
// box are confirmed with the distance evaluator:
//  - point objects: distance <= risk::thresholdForPoint(kind)
//  - line segments: min(distance to either endpoint) <= line threshold for
//    the line's voltage. This is an endpoint approximation, not a true
//    point-to-segment distance.
// A residential point gets one hit per object/segment it is close to, no
// deduplication is done here.
class ProximityEngine {
 public:
    // Throws std::invalid_argument if padDegrees is negative or not finite.
    explicit ProximityEngine(
        const geodesy::DistanceEvaluator& evaluator,
        double padDegrees = BBOX_PAD_DEGREES);

    // Runs detection over fully materialized inputs. Invalid coordinates are
    // dropped and counted. Throws risk::UnknownInfrastructureKind if a point
    // object has a kind without a threshold.
    DetectionResult run(
        const vector<infra::InfraPoint>& pointObjects,
        const vector<infra::InfraLine>& lines,
        const vector<infra::ResidentialPoint>& residentials);

    EngineState state() const { return state_; }
    double padDegrees() const { return pad_; }

 private:
    void scanPointObjects(DetectionResult* result) const;
    void scanLines(DetectionResult* result) const;

    const geodesy::DistanceEvaluator& evaluator_;
    double pad_;
    EngineState state_{EngineState::Idle};

    // valid residential points of the current run, positions match index_
    vector<infra::ResidentialPoint> residentials_;
    geo_index::GeoIndex index_;
};

}  // namespace proximity

#endif  // POWERLINE_RISK_PROXIMITY_HPP_
