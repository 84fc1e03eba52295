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
#include <doctest/doctest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>
#include <vector>
#include "../powerline_risk/proximity.hpp"
#include "../powerline_risk/risk_policy.hpp"

using std::string;
using std::vector;

using infra::GeoPoint;
using infra::InfraKind;
using infra::InfraLine;
using infra::InfraPoint;
using infra::ResidentialPoint;
using geodesy::GeodesicDistance;
using proximity::DetectionResult;
using proximity::EngineState;
using proximity::ProximityEngine;
using proximity::ProximityHit;
using proximity::SegmentSource;

namespace {

// Evaluator that reports the same distance for any two distinct coordinates
struct FixedDistance : geodesy::DistanceEvaluator {
    explicit FixedDistance(double meters) : value(meters) {}
    string name() const override { return "fixed"; }
    double value;

 protected:
    double meters(double, double, double, double) const override { return value; }
};

// residential id, source id, segment (-1 for point sources), distance
using HitKey = std::tuple<infra::ElementId, infra::ElementId, long, double>;

vector<HitKey> sortedKeys(const DetectionResult& result) {
    vector<HitKey> keys;
    for (const auto& hit : result.hits) {
        if (const auto* seg = std::get_if<SegmentSource>(&hit.source)) {
            keys.emplace_back(hit.residential.id, seg->lineId, static_cast<long>(seg->segmentIndex), hit.distanceM);
        } else {
            keys.emplace_back(hit.residential.id, std::get<InfraPoint>(hit.source).id, -1L, hit.distanceM);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

const double NaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

// -----------------------------------------------------------------------------
// Point objects
// -----------------------------------------------------------------------------

TEST_CASE("substation 5.5 m from a residential point is a hit") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    auto result = engine.run(
        { InfraPoint{100, 50.0, 40.0, InfraKind::Substation} },
        {},
        { ResidentialPoint{1, 50.00005, 40.0} });

    REQUIRE_EQ(result.hits.size(), 1u);
    const ProximityHit& hit = result.hits.front();
    CHECK_EQ(hit.residential.id, 1);
    REQUIRE(std::holds_alternative<InfraPoint>(hit.source));
    CHECK_EQ(std::get<InfraPoint>(hit.source).id, 100);
    CHECK(hit.distanceM == doctest::Approx(5.56).epsilon(0.01));
}

TEST_CASE("substation 111 m from a residential point is not a hit") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    auto result = engine.run(
        { InfraPoint{100, 50.0, 40.0, InfraKind::Substation} },
        {},
        { ResidentialPoint{1, 50.001, 40.0} });

    CHECK(result.hits.empty());
    CHECK_EQ(result.stats.candidatesExamined, 1u);
}

TEST_CASE("communication towers use the wider 45 m threshold") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);
    // ~33 m north
    const ResidentialPoint res{1, 50.0003, 40.0};

    auto tower = engine.run({ InfraPoint{7, 50.0, 40.0, InfraKind::CommunicationTower} }, {}, { res });
    auto transformer = engine.run({ InfraPoint{8, 50.0, 40.0, InfraKind::Transformer} }, {}, { res });

    CHECK_EQ(tower.hits.size(), 1u);
    CHECK(transformer.hits.empty());
}

TEST_CASE("point threshold is inclusive") {
    const vector<InfraPoint> objects{ InfraPoint{100, 50.0, 40.0, InfraKind::Converter} };
    const vector<ResidentialPoint> residentials{ ResidentialPoint{1, 50.00001, 40.0} };

    FixedDistance atThreshold(10.0);
    FixedDistance beyond(10.000001);

    CHECK_EQ(ProximityEngine(atThreshold).run(objects, {}, residentials).hits.size(), 1u);
    CHECK(ProximityEngine(beyond).run(objects, {}, residentials).hits.empty());
}

TEST_CASE("unknown point kind propagates to the caller") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    CHECK_THROWS_AS(
        engine.run(
            { InfraPoint{100, 50.0, 40.0, static_cast<InfraKind>(42)} },
            {},
            { ResidentialPoint{1, 50.0, 40.0} }),
        risk::UnknownInfrastructureKind);
    CHECK(engine.state() == EngineState::Scanning);
}

// -----------------------------------------------------------------------------
// Lines
// -----------------------------------------------------------------------------

TEST_CASE("750 kV line segment 30 m from a residential point is a hit") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    InfraLine line{500, { GeoPoint{1, 50.0, 40.0}, GeoPoint{2, 50.0, 40.002} }, string("750000")};
    // ~30 m north of the first vertex, ~146 m from the second
    auto result = engine.run({}, { line }, { ResidentialPoint{9, 50.00027, 40.0} });

    REQUIRE_EQ(result.hits.size(), 1u);
    const auto& hit = result.hits.front();
    REQUIRE(std::holds_alternative<SegmentSource>(hit.source));
    const auto& seg = std::get<SegmentSource>(hit.source);
    CHECK_EQ(seg.lineId, 500);
    CHECK_EQ(seg.lineIndex, 0u);
    CHECK_EQ(seg.segmentIndex, 0u);
    CHECK(hit.distanceM == doctest::Approx(30.0).epsilon(0.01));
    CHECK_EQ(result.stats.segmentsScanned, 1u);
}

TEST_CASE("low voltage line uses its 2 m thickness") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    InfraLine line{500, { GeoPoint{1, 50.0, 40.0}, GeoPoint{2, 50.0, 40.002} }, string("400")};
    auto result = engine.run({}, { line }, { ResidentialPoint{9, 50.00027, 40.0} });

    CHECK(result.hits.empty());
}

TEST_CASE("line distance is measured to the nearest endpoint only") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    // ~716 m long segment, residential point 5 m off its middle
    InfraLine line{500, { GeoPoint{1, 50.0, 40.0}, GeoPoint{2, 50.0, 40.01} }, std::nullopt};
    auto result = engine.run({}, { line }, { ResidentialPoint{9, 50.000045, 40.005} });

    CHECK(result.hits.empty());
    CHECK_EQ(result.stats.candidatesExamined, 1u);
}

TEST_CASE("residential point near a shared vertex hits both segments") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    InfraLine line{500, {
        GeoPoint{1, 50.0, 39.998},
        GeoPoint{2, 50.0, 40.0},
        GeoPoint{3, 50.0, 40.002},
    }, string("110000")};
    auto result = engine.run({}, { line }, { ResidentialPoint{9, 50.0001, 40.0} });

    REQUIRE_EQ(result.hits.size(), 2u);
    auto keys = sortedKeys(result);
    CHECK_EQ(std::get<2>(keys[0]), 0);
    CHECK_EQ(std::get<2>(keys[1]), 1);
    CHECK_EQ(result.stats.segmentsScanned, 2u);
}

TEST_CASE("lines with fewer than two vertices contribute no segments") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    InfraLine empty{1, {}, std::nullopt};
    InfraLine single{2, { GeoPoint{1, 50.0, 40.0} }, string("110000")};
    auto result = engine.run({}, { empty, single }, { ResidentialPoint{9, 50.0, 40.0} });

    CHECK(result.hits.empty());
    CHECK_EQ(result.stats.segmentsScanned, 0u);
    CHECK_EQ(result.lines.size(), 2u);
}

TEST_CASE("line vertices with invalid coordinates are skipped in order") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    InfraLine line{500, {
        GeoPoint{1, 50.0, 40.0},
        GeoPoint{2, NaN, 40.001},
        GeoPoint{3, 50.0, 40.002},
    }, string("750000")};
    auto result = engine.run({}, { line }, { ResidentialPoint{9, 50.00027, 40.002} });

    REQUIRE_EQ(result.lines.front().vertices.size(), 2u);
    CHECK_EQ(result.lines.front().vertices[0].id, 1);
    CHECK_EQ(result.lines.front().vertices[1].id, 3);
    CHECK_EQ(result.stats.droppedLineVertices, 1u);
    REQUIRE_EQ(result.hits.size(), 1u);
    CHECK_EQ(std::get<SegmentSource>(result.hits.front().source).segmentIndex, 0u);
}

// -----------------------------------------------------------------------------
// Whole runs
// -----------------------------------------------------------------------------

TEST_CASE("hits are not deduplicated across sources") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    InfraLine line{500, { GeoPoint{1, 50.0, 40.0}, GeoPoint{2, 50.0, 40.002} }, std::nullopt};
    auto result = engine.run(
        { InfraPoint{100, 50.0, 40.0, InfraKind::Substation},
          InfraPoint{101, 50.0, 40.0, InfraKind::Transformer} },
        { line },
        { ResidentialPoint{9, 50.00005, 40.0} });

    CHECK_EQ(result.hits.size(), 3u);
}

TEST_CASE("unresolvable coordinates are dropped before indexing") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    auto result = engine.run(
        { InfraPoint{100, 50.0, 40.0, InfraKind::Substation},
          InfraPoint{101, NaN, 40.0, InfraKind::Substation},
          InfraPoint{102, 50.0, 181.0, InfraKind::Substation} },
        {},
        { ResidentialPoint{1, 50.00005, 40.0},
          ResidentialPoint{2, NaN, NaN},
          ResidentialPoint{3, 91.0, 40.0} });

    CHECK_EQ(result.stats.droppedResidentials, 2u);
    CHECK_EQ(result.stats.droppedPointObjects, 2u);
    CHECK_EQ(result.pointObjects.size(), 1u);
    REQUIRE_EQ(result.hits.size(), 1u);
    CHECK_EQ(result.hits.front().residential.id, 1);
}

TEST_CASE("no residential points short-circuits after indexing") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);
    CHECK(engine.state() == EngineState::Idle);

    InfraLine line{500, { GeoPoint{1, 50.0, 40.0}, GeoPoint{2, 50.0, 40.002} }, std::nullopt};
    auto result = engine.run({ InfraPoint{100, 50.0, 40.0, InfraKind::Substation} }, { line }, {});

    CHECK(engine.state() == EngineState::Done);
    CHECK(result.hits.empty());
    CHECK_EQ(result.pointObjects.size(), 1u);
    CHECK_EQ(result.lines.size(), 1u);
    CHECK_EQ(result.stats.segmentsScanned, 0u);
}

TEST_CASE("empty inputs give an empty result") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    auto result = engine.run({}, {}, { ResidentialPoint{1, 50.0, 40.0} });

    CHECK(engine.state() == EngineState::Done);
    CHECK(result.hits.empty());
}

TEST_CASE("running twice on the same inputs gives the same hits") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic);

    const vector<InfraPoint> objects{
        InfraPoint{100, 50.0, 40.0, InfraKind::Substation},
        InfraPoint{101, 50.0005, 40.0005, InfraKind::CommunicationTower},
    };
    const vector<InfraLine> lines{
        InfraLine{500, { GeoPoint{1, 50.0, 40.0}, GeoPoint{2, 50.001, 40.001}, GeoPoint{3, 50.002, 40.0} },
            string("220000;110000")},
    };
    vector<ResidentialPoint> residentials;
    for (int i = 0; i < 40; ++i) {
        for (int j = 0; j < 40; ++j) {
            residentials.push_back(ResidentialPoint{i * 40 + j, 49.999 + i * 0.0001, 39.999 + j * 0.0001});
        }
    }

    auto first = engine.run(objects, lines, residentials);
    auto second = engine.run(objects, lines, residentials);

    CHECK_FALSE(first.hits.empty());
    CHECK(sortedKeys(first) == sortedKeys(second));
}

TEST_CASE("a zero pad only finds points at the exact location") {
    GeodesicDistance geodesic;
    ProximityEngine engine(geodesic, 0.0);

    auto result = engine.run(
        { InfraPoint{100, 50.0, 40.0, InfraKind::Substation} },
        {},
        { ResidentialPoint{1, 50.0, 40.0}, ResidentialPoint{2, 50.00005, 40.0} });

    REQUIRE_EQ(result.hits.size(), 1u);
    CHECK_EQ(result.hits.front().residential.id, 1);
    CHECK_EQ(result.hits.front().distanceM, 0.0);
}

TEST_CASE("engine rejects a negative or non-finite pad") {
    GeodesicDistance geodesic;
    CHECK_THROWS_AS(ProximityEngine(geodesic, -0.01), std::invalid_argument);
    CHECK_THROWS_AS(ProximityEngine(geodesic, NaN), std::invalid_argument);
    CHECK_EQ(ProximityEngine(geodesic).padDegrees(), proximity::BBOX_PAD_DEGREES);
}
