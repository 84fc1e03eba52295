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
#ifndef POWERLINE_RISK_RISK_POLICY_HPP_
#define POWERLINE_RISK_RISK_POLICY_HPP_

#include <optional>   // for optional
#include <stdexcept>  // for runtime_error
#include <string>     // for string

#include "infrastructure.hpp"

using std::optional;
using std::string;

namespace risk {

// detection radius around point infrastructure, meters
const double COMMUNICATION_TOWER_THRESHOLD_M = 45.0;
const double SUBSTATION_THRESHOLD_M = 10.0;
const double TRANSFORMER_THRESHOLD_M = 10.0;
const double CONVERTER_THRESHOLD_M = 10.0;

// line thickness when the voltage tag is missing or empty
const double DEFAULT_THICKNESS_M = 40.0;
// line thickness when the voltage tag can't be parsed, or the voltage isn't in the table
const double FALLBACK_THICKNESS_M = 20.0;
// line thickness is used as the detection radius as is
const double LINE_THRESHOLD_MULTIPLIER = 1.0;

// Thrown when a point object carries a kind the policy has no threshold for
class UnknownInfrastructureKind : public std::runtime_error {
 public:
    using std::runtime_error::runtime_error;
};

double thresholdForPoint(infra::InfraKind kind);
double thicknessForVoltage(const optional<string>& voltage);
double lineThreshold(double thickness);

optional<long long> parseMaxVoltage(const string& field);
infra::InfraKind parseInfraKind(const string& tag);
string kindName(infra::InfraKind kind);

}  // namespace risk

#endif  // POWERLINE_RISK_RISK_POLICY_HPP_
