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
#ifndef POWERLINE_RISK_OVERPASS_HPP_
#define POWERLINE_RISK_OVERPASS_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <set>                    // for set
#include <string>                 // for string
#include <unordered_map>          // for unordered_map
#include <vector>                 // for vector

#include "infrastructure.hpp"
#include "utils.hpp"

using std::optional;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace overpass {

const char DEFAULT_ENDPOINT[] = "http://overpass-api.de/api/interpreter";

// server side limit put into every query, seconds
const int QUERY_TIMEOUT_S = 25;

// infrastructure categories that can be requested from Overpass
enum class Category {
    PowerLine,
    CommunicationTower,
    Substation,
    Transformer,
    Converter
};

using CategorySet = std::set<Category>;

// power=line way before its node references are resolved
struct RawWay {
    infra::ElementId id{};
    vector<infra::ElementId> nodeIds;
    optional<string> voltage;
};

// everything a power query returns, normalized
struct PowerData {
    // every node with coordinates, tagged or not
    std::unordered_map<infra::ElementId, infra::GeoPoint> nodes;
    vector<infra::InfraPoint> pointObjects;
    vector<RawWay> ways;
};

string escapeAreaName(const string& area);
string buildPowerQuery(const string& area, const CategorySet& categories);
string buildBuildingsQuery(const string& area);

json parseDocument(const string& body, const string& what);
PowerData parsePowerElements(const json& doc);
vector<infra::ResidentialPoint> parseBuildingElements(const json& doc);
vector<infra::InfraLine> resolveLines(
    const vector<RawWay>& ways,
    const std::unordered_map<infra::ElementId, infra::GeoPoint>& nodes);

PowerData fetchPowerObjects(
    utils::IHttpClient& client, const string& endpoint,
    const string& area, const CategorySet& categories);
vector<infra::ResidentialPoint> fetchBuildings(
    utils::IHttpClient& client, const string& endpoint, const string& area);

PowerData loadPowerFile(const string& path);
vector<infra::ResidentialPoint> loadBuildingsFile(const string& path);

}  // namespace overpass

#endif  // POWERLINE_RISK_OVERPASS_HPP_
