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
#include "risk_policy.hpp"
#include <algorithm>     // for transform
#include <cctype>        // for isspace, tolower
#include <charconv>      // for from_chars
#include <optional>      // for optional, nullopt
#include <string>        // for string
#include <system_error>  // for errc

using std::string;
using std::optional;
using std::nullopt;

using infra::InfraKind;

namespace risk {

namespace {

// strips leading and trailing whitespace
string trim(const string& s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

// Parses a whole token as a signed decimal integer, optional leading '+'
optional<long long> parseInteger(const string& token) {
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (first != last && *first == '+') {
        ++first;
        if (first != last && *first == '-') return nullopt;
    }
    if (first == last) return nullopt;

    long long value = 0;
    const auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) return nullopt;
    return value;
}

// voltage table, volts -> meters
double thicknessForMaxVoltage(long long volts) {
    if (volts < 1000) return 2.0;
    if (volts < 20000) return 10.0;
    if (volts == 35000) return 15.0;
    if (volts == 110000) return 20.0;
    if (volts == 150000 || volts == 220000) return 25.0;
    if (volts == 330000 || volts == 400000 || volts == 500000) return 30.0;
    if (volts == 750000) return 40.0;
    if (volts == 1150000) return 55.0;
    return FALLBACK_THICKNESS_M;
}

}  // namespace

// Detection radius for point infrastructure
//
// Args:
//    kind: kind of the point object
// Returns:
//    threshold distance in meters
// Throws:
//    UnknownInfrastructureKind if kind is not one of the enumerated kinds
double thresholdForPoint(InfraKind kind) {
    switch (kind) {
        case InfraKind::CommunicationTower: return COMMUNICATION_TOWER_THRESHOLD_M;
        case InfraKind::Substation: return SUBSTATION_THRESHOLD_M;
        case InfraKind::Transformer: return TRANSFORMER_THRESHOLD_M;
        case InfraKind::Converter: return CONVERTER_THRESHOLD_M;
    }
    throw UnknownInfrastructureKind(
        "No risk threshold for infrastructure kind " + std::to_string(static_cast<int>(kind)));
}

// Line thickness derived from the raw voltage tag
//
// Args:
//    voltage: raw tag value, may hold several ';' separated voltages
// Returns:
//    DEFAULT_THICKNESS_M when absent or empty, FALLBACK_THICKNESS_M when
//    malformed, otherwise the table value for the highest voltage
double thicknessForVoltage(const optional<string>& voltage) {
    if (!voltage || voltage->empty()) return DEFAULT_THICKNESS_M;
    const auto maxVoltage = parseMaxVoltage(*voltage);
    if (!maxVoltage) return FALLBACK_THICKNESS_M;
    return thicknessForMaxVoltage(*maxVoltage);
}

double lineThreshold(double thickness) {
    return thickness * LINE_THRESHOLD_MULTIPLIER;
}

// Highest voltage in a ';' separated list. Every token must parse, otherwise
// the whole field is malformed and nullopt is returned.
optional<long long> parseMaxVoltage(const string& field) {
    optional<long long> best;
    size_t start = 0;
    while (true) {
        const size_t end = field.find(';', start);
        const string token = trim(field.substr(start, end == string::npos ? string::npos : end - start));
        const auto value = parseInteger(token);
        if (!value) return nullopt;
        if (!best || *value > *best) best = value;
        if (end == string::npos) break;
        start = end + 1;
    }
    return best;
}

// Maps a normalized infrastructure tag to its kind
//
// Args:
//     tag: "substation", "transformer", "converter" or "communication_tower",
//         case-insensitive
// Returns:
//     the matching kind
// Throws:
//     UnknownInfrastructureKind for any other tag
InfraKind parseInfraKind(const string& tag) {
    string lower = tag;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "substation") return InfraKind::Substation;
    if (lower == "transformer") return InfraKind::Transformer;
    if (lower == "converter") return InfraKind::Converter;
    if (lower == "communication_tower") return InfraKind::CommunicationTower;
    throw UnknownInfrastructureKind("Unknown infrastructure kind: '" + tag + "'");
}

string kindName(InfraKind kind) {
    switch (kind) {
        case InfraKind::Substation: return "Substation";
        case InfraKind::Transformer: return "Transformer";
        case InfraKind::Converter: return "Converter";
        case InfraKind::CommunicationTower: return "Communication Tower";
    }
    throw UnknownInfrastructureKind(
        "No name for infrastructure kind " + std::to_string(static_cast<int>(kind)));
}

}  // namespace risk
