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
#ifndef POWERLINE_RISK_REPORT_HPP_
#define POWERLINE_RISK_REPORT_HPP_

#include <iosfwd>  // for ostream
#include <string>  // for string

#include "proximity.hpp"

namespace report {

const char POWER_LINE_LABEL[] = "Power Line";

std::string sourceLabel(const proximity::HitSource& source);
void writeHitsCsv(std::ostream& out, const proximity::DetectionResult& result);
void writeHitsCsvFile(const std::string& path, const proximity::DetectionResult& result);
void summarize(std::ostream& out, const proximity::DetectionResult& result);

}  // namespace report

#endif  // POWERLINE_RISK_REPORT_HPP_
