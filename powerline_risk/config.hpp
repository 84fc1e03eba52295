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
#ifndef POWERLINE_RISK_CONFIG_HPP_
#define POWERLINE_RISK_CONFIG_HPP_

#include <optional>  // for optional
#include <string>    // for string

#include "geodesy.hpp"
#include "overpass.hpp"
#include "proximity.hpp"

using std::optional;
using std::string;

namespace config {

const char DEFAULT_AREA[] = "Волгоград";
const long DEFAULT_TIMEOUT_S = 60;

// input args for main entry point
struct Args {
    string area = DEFAULT_AREA;
    overpass::CategorySet categories;
    string endpoint = overpass::DEFAULT_ENDPOINT;
    // offline input, both or neither
    optional<string> powerJson;
    optional<string> buildingsJson;
    double pad = proximity::BBOX_PAD_DEGREES;
    string distance = geodesy::GEODESIC;
    long timeoutSeconds = DEFAULT_TIMEOUT_S;
    optional<string> outCsv;
};

bool parseArgs(int argc, char** argv, Args* out);
void usage(const char* exe);

}  // namespace config

#endif  // POWERLINE_RISK_CONFIG_HPP_
