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

#include "overpass.hpp"
#include <cmath>                  // for NAN
#include <fstream>                // for basic_ifstream
#include <iostream>               // for basic_ostream, operator<<, basic_os...
#include <iterator>               // for istreambuf_iterator
#include <nlohmann/json.hpp>      // for basic_json
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <sstream>                // for basic_ostringstream
#include <stdexcept>              // for runtime_error
#include <string>                 // for char_traits, basic_string, allocator
#include <unordered_map>          // for unordered_map
#include <utility>                // for move
#include <vector>                 // for vector

#include "risk_policy.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::runtime_error;
using std::optional;
using std::ostringstream;
using std::ifstream;
using std::unordered_map;
using std::move;
using json = nlohmann::json;

using infra::ElementId;
using infra::GeoPoint;
using infra::InfraKind;
using infra::InfraLine;
using infra::InfraPoint;
using infra::ResidentialPoint;
using utils::IHttpClient;
using utils::httpGet;
using utils::urlEncode;

namespace overpass {

namespace {

// Overpass QL preamble up to and including the union's opening bracket
string queryHeader(const string& area) {
    ostringstream q;
    q << "[out:json][timeout:" << QUERY_TIMEOUT_S << "];\n"
      << "area[name=\"" << escapeAreaName(area) << "\"]->.searchArea;\n"
      << "(\n";
    return q.str();
}

// closes the union, prints tagged elements then the nodes they reference
const char QUERY_FOOTER[] = ");\nout body;\n>;\nout skel qt;";

// number stored under key, or NAN if absent, null or not a number
double numberOrNan(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return NAN;
    return it->get<double>();
}

// Reads the whole file into memory
string readFile(const string& path) {
    ifstream in(path, std::ios::binary);
    if (!in) throw runtime_error("Failed to open Overpass JSON: " + path);
    return string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Returns the elements array of an Overpass response
const json& elementsOf(const json& doc) {
    if (!doc.is_object() || !doc.contains("elements") || !doc["elements"].is_array())
        throw runtime_error("Invalid Overpass response (no elements array)");
    return doc["elements"];
}

}  // namespace

// Escapes an area name for use inside a double quoted Overpass QL string
string escapeAreaName(const string& area) {
    string out;
    out.reserve(area.size());
    for (char c : area) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

// Builds the Overpass QL query for the requested infrastructure categories
//
// Args:
//    area: the OSM area name to search in, e.g. "Волгоград"
//    categories: infrastructure categories to include
// Returns:
//    the query; with no categories it only asks for the city node so the
//    caller still gets a location to centre on
string buildPowerQuery(const string& area, const CategorySet& categories) {
    ostringstream q;
    q << queryHeader(area);
    if (categories.empty()) {
        q << "node[\"place\"=\"city\"](area.searchArea);\n";
    }
    for (Category c : categories) {
        switch (c) {
            case Category::PowerLine:
                q << "way[\"power\"=\"line\"](area.searchArea);\n";
                break;
            case Category::CommunicationTower:
                q << "node[\"man_made\"=\"tower\"][\"tower:type\"=\"communication\"](area.searchArea);\n";
                break;
            case Category::Substation:
                q << "node[\"power\"=\"substation\"](area.searchArea);\n";
                break;
            case Category::Transformer:
                q << "node[\"power\"=\"transformer\"](area.searchArea);\n";
                break;
            case Category::Converter:
                q << "node[\"power\"=\"converter\"](area.searchArea);\n";
                break;
        }
    }
    q << QUERY_FOOTER;
    return q.str();
}

// Builds the Overpass QL query for building outlines and their nodes
string buildBuildingsQuery(const string& area) {
    ostringstream q;
    q << queryHeader(area)
      << "way[\"building\"](area.searchArea);\n"
      << "node(w)->.x;\n"
      << QUERY_FOOTER;
    return q.str();
}

// Parses an Overpass JSON document
//
// Args:
//    body: raw response text
//    what: description used in the error message
// Returns:
//    the parsed document
// Throws:
//    runtime_error if body isn't valid JSON
json parseDocument(const string& body, const string& what) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) throw runtime_error("Invalid JSON in " + what);
    return doc;
}

// Normalizes the elements of a power query response.
//
// Nodes with coordinates go into the node table. A node tagged
// man_made=tower + tower:type=communication becomes a communication tower,
// otherwise a power=substation|transformer|converter tag selects the kind.
// Other power values (tower, pole, ...) are line supports, not point objects,
// and are skipped. Ways keep their node references for resolveLines.
//
// Args:
//    doc: parsed Overpass response
// Returns:
//    node table, point objects and raw ways
PowerData parsePowerElements(const json& doc) {
    PowerData data;
    size_t skippedTags = 0;

    for (const auto& element : elementsOf(doc)) {
        if (!element.is_object()) continue;
        const string type = element.value("type", "");
        if (!element.contains("id") || !element["id"].is_number_integer()) continue;
        const ElementId id = element["id"].get<ElementId>();
        const json tags = element.value("tags", json::object());

        if (type == "node") {
            const double lat = numberOrNan(element, "lat");
            const double lon = numberOrNan(element, "lon");
            if (infra::isValidCoordinate(lat, lon)) data.nodes[id] = GeoPoint{id, lat, lon};

            if (tags.value("man_made", "") == "tower" && tags.value("tower:type", "") == "communication") {
                data.pointObjects.push_back(InfraPoint{id, lat, lon, InfraKind::CommunicationTower});
            } else if (tags.contains("power")) {
                const string power = tags.value("power", "");
                if (power == "substation" || power == "transformer" || power == "converter") {
                    data.pointObjects.push_back(InfraPoint{id, lat, lon, risk::parseInfraKind(power)});
                } else {
                    ++skippedTags;
                }
            }
        } else if (type == "way") {
            RawWay way;
            way.id = id;
            if (element.contains("nodes") && element["nodes"].is_array()) {
                for (const auto& ref : element["nodes"]) {
                    if (ref.is_number_integer()) way.nodeIds.push_back(ref.get<ElementId>());
                }
            }
            auto voltage = tags.find("voltage");
            if (voltage != tags.end() && !voltage->is_null()) {
                way.voltage = voltage->is_string() ? voltage->get<string>() : voltage->dump();
            }
            data.ways.push_back(move(way));
        }
    }

    if (skippedTags > 0) {
        cerr << "[warn] Skipped " << skippedTags
             << " power nodes that are not substations, transformers or converters\n";
    }
    return data;
}

// Every node of a buildings response is a residential point. Missing
// coordinates become NAN and are dropped by the proximity engine.
vector<ResidentialPoint> parseBuildingElements(const json& doc) {
    vector<ResidentialPoint> out;
    for (const auto& element : elementsOf(doc)) {
        if (!element.is_object() || element.value("type", "") != "node") continue;
        if (!element.contains("id") || !element["id"].is_number_integer()) continue;
        out.push_back(ResidentialPoint{
            element["id"].get<ElementId>(),
            numberOrNan(element, "lat"),
            numberOrNan(element, "lon")});
    }
    return out;
}

// Resolves way node references against the node table
//
// Args:
//    ways: raw power line ways
//    nodes: node id -> coordinates
// Returns:
//    one line per way, references without a node are left out, order is kept
vector<InfraLine> resolveLines(
    const vector<RawWay>& ways,
    const unordered_map<ElementId, GeoPoint>& nodes) {
    vector<InfraLine> lines;
    lines.reserve(ways.size());
    for (const auto& way : ways) {
        InfraLine line;
        line.id = way.id;
        line.voltage = way.voltage;
        line.vertices.reserve(way.nodeIds.size());
        for (ElementId ref : way.nodeIds) {
            auto it = nodes.find(ref);
            if (it != nodes.end()) line.vertices.push_back(it->second);
        }
        lines.push_back(move(line));
    }
    return lines;
}

// Fetches power infrastructure for an area from Overpass
//
// Args:
//    client: HTTP client
//    endpoint: Overpass interpreter URL
//    area: OSM area name
//    categories: infrastructure categories to request
// Returns:
//    normalized power data
PowerData fetchPowerObjects(
    IHttpClient& client, const string& endpoint,
    const string& area, const CategorySet& categories) {
    const string url = endpoint + "?data=" + urlEncode(buildPowerQuery(area, categories));
    const string body = httpGet(client, url);
    auto data = parsePowerElements(parseDocument(body, "Overpass power response"));
    cerr << "[info] Power objects: " << data.pointObjects.size()
         << ", power lines: " << data.ways.size() << "\n";
    return data;
}

// Fetches residential building nodes for an area from Overpass
vector<ResidentialPoint> fetchBuildings(IHttpClient& client, const string& endpoint, const string& area) {
    const string url = endpoint + "?data=" + urlEncode(buildBuildingsQuery(area));
    const string body = httpGet(client, url);
    auto points = parseBuildingElements(parseDocument(body, "Overpass buildings response"));
    cerr << "[info] Residential points: " << points.size() << "\n";
    return points;
}

PowerData loadPowerFile(const string& path) {
    return parsePowerElements(parseDocument(readFile(path), path));
}

vector<ResidentialPoint> loadBuildingsFile(const string& path) {
    return parseBuildingElements(parseDocument(readFile(path), path));
}

}  // namespace overpass
