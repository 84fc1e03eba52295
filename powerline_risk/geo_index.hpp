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
#ifndef POWERLINE_RISK_GEO_INDEX_HPP_
#define POWERLINE_RISK_GEO_INDEX_HPP_

#include <stddef.h>  // for size_t
#include <utility>   // for pair
#include <vector>    // for vector

#include <boost/geometry/core/cs.hpp>             // for cs::cartesian
#include <boost/geometry/geometries/box.hpp>      // for model::box
#include <boost/geometry/geometries/point.hpp>    // for model::point
#include <boost/geometry/algorithms/intersects.hpp>  // for intersects(point, box)
#include <boost/geometry/index/rtree.hpp>         // for rtree, intersects

#include "infrastructure.hpp"

using std::vector;

namespace geo_index {

namespace bg = ::boost::geometry;
namespace bgi = ::boost::geometry::index;

// axis-aligned lon/lat rectangle, boundaries inclusive
struct BoundingBox {
    double minLon{}, minLat{}, maxLon{}, maxLat{};
};

// Box around a single coordinate, grown by pad degrees on both axes
BoundingBox paddedBox(double lat, double lon, double pad);

// Box spanning both segment endpoints, grown by pad degrees on both axes
BoundingBox paddedBox(const infra::GeoPoint& a, const infra::GeoPoint& b, double pad);

// Read-only spatial index over residential points.
//
// Each point is stored as a cartesian (lon, lat) point together with its
// position in the vector it was built from. Queries are a sound
// over-approximation: every point inside the query box is returned, callers
// filter by true distance.
class GeoIndex {
 public:
    GeoIndex() = default;

    // Bulk-loads an index from the given points. Position i in query results
    // refers to points[i].
    static GeoIndex build(const vector<infra::ResidentialPoint>& points);

    // Returns positions of all indexed points inside box, in no particular
    // order. An inverted box (min > max) yields no candidates.
    vector<size_t> query(const BoundingBox& box) const;

    size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

 private:
    using IndexPoint = bg::model::point<double, 2, bg::cs::cartesian>;
    using IndexBox = bg::model::box<IndexPoint>;
    using Entry = std::pair<IndexPoint, size_t>;
    using Tree = bgi::rtree<Entry, bgi::rstar<16>>;

    explicit GeoIndex(Tree tree) : tree_(std::move(tree)) {}

    Tree tree_;
};

}  // namespace geo_index

#endif  // POWERLINE_RISK_GEO_INDEX_HPP_
