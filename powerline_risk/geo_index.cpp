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
#include "geo_index.hpp"
#include <algorithm>  // for max, min
#include <cstddef>    // for size_t
#include <utility>    // for move
#include <vector>     // for vector

using std::vector;
using std::min;
using std::max;

using infra::GeoPoint;
using infra::ResidentialPoint;

namespace geo_index {
    // Box around a single coordinate
    //
    // Args:
    //    lat: latitude of the centre
    //    lon: longitude of the centre
    //    pad: margin in degrees added on every side
    // Returns:
    //    the padded bounding box
    BoundingBox paddedBox(double lat, double lon, double pad) {
        return BoundingBox{lon - pad, lat - pad, lon + pad, lat + pad};
    }

    // Box spanning a segment
    //
    // Args:
    //    a: first segment endpoint
    //    b: second segment endpoint
    //    pad: margin in degrees added on every side
    // Returns:
    //    the padded bounding box covering both endpoints
    BoundingBox paddedBox(const GeoPoint& a, const GeoPoint& b, double pad) {
        return BoundingBox{
            min(a.lon, b.lon) - pad,
            min(a.lat, b.lat) - pad,
            max(a.lon, b.lon) + pad,
            max(a.lat, b.lat) + pad};
    }

    // Builds the index with the packing algorithm, positions follow input order
    GeoIndex GeoIndex::build(const vector<ResidentialPoint>& points) {
        vector<Entry> entries;
        entries.reserve(points.size());
        for (size_t pos = 0; pos < points.size(); ++pos) {
            entries.emplace_back(IndexPoint(points[pos].lon, points[pos].lat), pos);
        }
        return GeoIndex(Tree(entries.begin(), entries.end()));
    }

    vector<size_t> GeoIndex::query(const BoundingBox& box) const {
        vector<size_t> positions;
        if (box.minLon > box.maxLon || box.minLat > box.maxLat) return positions;

        const IndexBox queryBox(IndexPoint(box.minLon, box.minLat), IndexPoint(box.maxLon, box.maxLat));
        for (auto it = tree_.qbegin(bgi::intersects(queryBox)); it != tree_.qend(); ++it) {
            positions.push_back(it->second);
        }
        return positions;
    }
}  // namespace geo_index
