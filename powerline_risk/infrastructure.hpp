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
#ifndef POWERLINE_RISK_INFRASTRUCTURE_HPP_
#define POWERLINE_RISK_INFRASTRUCTURE_HPP_

#include <cmath>     // for isfinite
#include <cstdint>   // for int64_t
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

using std::optional;
using std::string;
using std::vector;

namespace infra {

// -------------------------------------------
// structures for holding geocoded input data
// -------------------------------------------

// OSM-style element identifier
using ElementId = std::int64_t;

// lat/lon point with the id of the node it came from
struct GeoPoint {
    ElementId id{};
    double lat{}, lon{};
};

// kinds of point infrastructure the risk policy knows about
enum class InfraKind {
    Substation,
    Transformer,
    Converter,
    CommunicationTower
};

// substation, transformer, converter or communication tower
struct InfraPoint {
    ElementId id{};
    double lat{}, lon{};
    InfraKind kind{InfraKind::Substation};
};

// power line polyline
struct InfraLine {
    ElementId id{};
    // resolved vertices, in way order
    vector<GeoPoint> vertices;
    // raw voltage tag, e.g. "110000" or "220000;110000"
    optional<string> voltage;
};

// residential building node
struct ResidentialPoint {
    ElementId id{};
    double lat{}, lon{};
};

// Returns true if lat/lon are finite and inside the geographic ranges
//
// Args:
//     lat: latitude in degrees
//     lon: longitude in degrees
// Returns:
//     true if lat is in [-90, 90] and lon is in [-180, 180]
inline bool isValidCoordinate(double lat, double lon) {
    return std::isfinite(lat) && std::isfinite(lon) &&
        lat >= -90.0 && lat <= 90.0 &&
        lon >= -180.0 && lon <= 180.0;
}

}  // namespace infra

#endif  // POWERLINE_RISK_INFRASTRUCTURE_HPP_
