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
#include "geodesy.hpp"
#include <cmath>      // for sin, cos, atan2, sqrt
#include <memory>     // for unique_ptr, make_unique
#include <stdexcept>  // for invalid_argument
#include <string>     // for string
#include <utility>    // for swap

#include <boost/geometry/algorithms/distance.hpp>                  // for distance
#include <boost/geometry/core/cs.hpp>                              // for cs::geographic
#include <boost/geometry/geometries/point.hpp>                     // for model::point
#include <boost/geometry/srs/spheroid.hpp>                         // for srs::spheroid
#include <boost/geometry/strategies/geographic/distance_karney.hpp>  // for karney

using std::string;
using std::unique_ptr;
using std::invalid_argument;

using infra::GeoPoint;

namespace bg = ::boost::geometry;

namespace geodesy {

namespace {

using GeographicPoint = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;
using KarneyStrategy = bg::strategy::distance::karney<bg::srs::spheroid<double>>;

constexpr double PI = 3.14159265358979323846;

double toRadians(double degrees) { return degrees * PI / 180.0; }

}  // namespace

// Orders the two coordinates before delegating, so swapping the arguments
// gives the same floating point result
double DistanceEvaluator::distance(const GeoPoint& a, const GeoPoint& b) const {
    if (a.lat == b.lat && a.lon == b.lon) return 0.0;
    double lat1 = a.lat, lon1 = a.lon;
    double lat2 = b.lat, lon2 = b.lon;
    if (lat2 < lat1 || (lat2 == lat1 && lon2 < lon1)) {
        std::swap(lat1, lat2);
        std::swap(lon1, lon2);
    }
    return meters(lat1, lon1, lat2, lon2);
}

double GeodesicDistance::meters(double lat1, double lon1, double lat2, double lon2) const {
    // boost.geometry geographic points are (lon, lat)
    const GeographicPoint p1(lon1, lat1);
    const GeographicPoint p2(lon2, lat2);
    return bg::distance(p1, p2, KarneyStrategy());
}

double HaversineDistance::meters(double lat1, double lon1, double lat2, double lon2) const {
    const double dLat = toRadians(lat2 - lat1);
    const double dLon = toRadians(lon2 - lon1);
    const double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
        std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
        std::sin(dLon / 2) * std::sin(dLon / 2);
    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return EARTH_RADIUS_METERS * c;
}

// Factory for the --distance option
//
// Args:
//     name: "geodesic" or "haversine"
// Returns:
//     a newly allocated evaluator
unique_ptr<DistanceEvaluator> makeDistanceEvaluator(const string& name) {
    if (name == GEODESIC) return std::make_unique<GeodesicDistance>();
    if (name == HAVERSINE) return std::make_unique<HaversineDistance>();
    throw invalid_argument("Unknown distance evaluator: " + name);
}

}  // namespace geodesy
