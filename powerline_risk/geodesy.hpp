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
#pragma once
#include <memory>
#include <string>

#include "infrastructure.hpp"

using std::string;

namespace geodesy {

const char GEODESIC[] = "geodesic";
const char HAVERSINE[] = "haversine";

const double EARTH_RADIUS_METERS = 6371000.0;

// Interface for surface distance between two lat/lon coordinates.
// One evaluator is used for every comparison in a detection run.
struct DistanceEvaluator {
    virtual ~DistanceEvaluator() = default;

    // Distance in meters between a and b. Symmetric, and exactly 0 when both
    // coordinates are identical. Ids are ignored.
    double distance(const infra::GeoPoint& a, const infra::GeoPoint& b) const;

    virtual string name() const = 0;

 protected:
    virtual double meters(double lat1, double lon1, double lat2, double lon2) const = 0;
};

// Geodesic distance on the WGS-84 ellipsoid (Karney's method via Boost.Geometry)
class GeodesicDistance : public DistanceEvaluator {
 public:
    string name() const override { return GEODESIC; }

 protected:
    double meters(double lat1, double lon1, double lat2, double lon2) const override;
};

// Great-circle distance on a sphere of EARTH_RADIUS_METERS
class HaversineDistance : public DistanceEvaluator {
 public:
    string name() const override { return HAVERSINE; }

 protected:
    double meters(double lat1, double lon1, double lat2, double lon2) const override;
};

// Creates the evaluator registered under name ("geodesic" or "haversine").
// Throws std::invalid_argument for any other name.
std::unique_ptr<DistanceEvaluator> makeDistanceEvaluator(const string& name);

}  // namespace geodesy
