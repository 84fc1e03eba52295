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
#include "proximity.hpp"
#include <algorithm>  // for min
#include <cmath>      // for isfinite
#include <cstddef>    // for size_t
#include <iostream>   // for basic_ostream, operator<<, cerr
#include <sstream>    // for ostringstream
#include <stdexcept>  // for invalid_argument
#include <utility>    // for move
#include <vector>     // for vector

#include "risk_policy.hpp"

using std::vector;
using std::cerr;
using std::min;
using std::move;
using std::ostringstream;
using std::invalid_argument;

using infra::GeoPoint;
using infra::InfraLine;
using infra::InfraPoint;
using infra::ResidentialPoint;
using infra::isValidCoordinate;
using geo_index::GeoIndex;
using geo_index::paddedBox;

namespace proximity {

ProximityEngine::ProximityEngine(const geodesy::DistanceEvaluator& evaluator, double padDegrees)
    : evaluator_(evaluator), pad_(padDegrees) {
    if (!std::isfinite(padDegrees) || padDegrees < 0.0) {
        ostringstream oss;
        oss << "Bounding box pad must be a non-negative number of degrees, got " << padDegrees;
        throw invalid_argument(oss.str());
    }
}

// Runs one detection pass: Idle -> Indexed -> Scanning -> Done
//
// Args:
//    pointObjects: substations, transformers, converters, communication towers
//    lines: power lines with resolved vertices
//    residentials: residential building points
// Returns:
//    hits plus the valid point objects and lines
DetectionResult ProximityEngine::run(
    const vector<InfraPoint>& pointObjects,
    const vector<InfraLine>& lines,
    const vector<ResidentialPoint>& residentials) {
    state_ = EngineState::Idle;
    DetectionResult result;

    // 1) index residential points, skipping unresolvable coordinates
    residentials_.clear();
    residentials_.reserve(residentials.size());
    for (const auto& res : residentials) {
        if (isValidCoordinate(res.lat, res.lon)) {
            residentials_.push_back(res);
        } else {
            ++result.stats.droppedResidentials;
        }
    }
    if (result.stats.droppedResidentials > 0) {
        cerr << "[warn] Dropped " << result.stats.droppedResidentials
             << " residential points with unresolvable coordinates\n";
    }
    index_ = GeoIndex::build(residentials_);
    state_ = EngineState::Indexed;

    // 2) pass-through inputs, minus what can't be located
    result.pointObjects.reserve(pointObjects.size());
    for (const auto& obj : pointObjects) {
        if (!isValidCoordinate(obj.lat, obj.lon)) {
            cerr << "[warn] Dropping infrastructure node " << obj.id
                 << " with unresolvable coordinates\n";
            ++result.stats.droppedPointObjects;
            continue;
        }
        result.pointObjects.push_back(obj);
    }
    result.lines.reserve(lines.size());
    for (const auto& line : lines) {
        InfraLine kept;
        kept.id = line.id;
        kept.voltage = line.voltage;
        kept.vertices.reserve(line.vertices.size());
        for (const auto& vertex : line.vertices) {
            if (isValidCoordinate(vertex.lat, vertex.lon)) {
                kept.vertices.push_back(vertex);
            } else {
                ++result.stats.droppedLineVertices;
            }
        }
        result.lines.push_back(move(kept));
    }

    if (index_.empty()) {
        cerr << "[info] No residential points to check, skipping scan\n";
        state_ = EngineState::Done;
        return result;
    }

    // 3) scan
    state_ = EngineState::Scanning;
    scanPointObjects(&result);
    scanLines(&result);
    state_ = EngineState::Done;
    return result;
}

void ProximityEngine::scanPointObjects(DetectionResult* result) const {
    for (const auto& obj : result->pointObjects) {
        const double threshold = risk::thresholdForPoint(obj.kind);
        const GeoPoint centre{obj.id, obj.lat, obj.lon};

        const auto candidates = index_.query(paddedBox(obj.lat, obj.lon, pad_));
        result->stats.candidatesExamined += candidates.size();
        for (size_t pos : candidates) {
            const auto& res = residentials_[pos];
            const double d = evaluator_.distance(centre, GeoPoint{res.id, res.lat, res.lon});
            if (d <= threshold) {
                result->hits.push_back(ProximityHit{res, obj, d});
            }
        }
    }
}

void ProximityEngine::scanLines(DetectionResult* result) const {
    for (size_t lineIndex = 0; lineIndex < result->lines.size(); ++lineIndex) {
        const InfraLine& line = result->lines[lineIndex];
        const auto& vertices = line.vertices;
        if (vertices.size() < 2) continue;

        const double threshold = risk::lineThreshold(risk::thicknessForVoltage(line.voltage));

        for (size_t seg = 0; seg + 1 < vertices.size(); ++seg) {
            const GeoPoint& start = vertices[seg];
            const GeoPoint& end = vertices[seg + 1];
            ++result->stats.segmentsScanned;

            const auto candidates = index_.query(paddedBox(start, end, pad_));
            result->stats.candidatesExamined += candidates.size();
            for (size_t pos : candidates) {
                const auto& res = residentials_[pos];
                const GeoPoint resPoint{res.id, res.lat, res.lon};
                // nearest endpoint, not nearest point on the segment
                const double d = min(
                    evaluator_.distance(start, resPoint),
                    evaluator_.distance(end, resPoint));
                if (d <= threshold) {
                    result->hits.push_back(ProximityHit{res, SegmentSource{line.id, lineIndex, seg}, d});
                }
            }
        }
    }
}

}  // namespace proximity
