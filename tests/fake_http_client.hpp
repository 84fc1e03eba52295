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
#pragma once
#include <string>
#include <vector>
#include "../powerline_risk/utils.hpp"

// Returns a canned response and records every requested URL
struct FakeHttpClient : utils::IHttpClient {
    utils::HttpResponse next;
    std::vector<std::string> requested;

    utils::HttpResponse get(const std::string& url) override {
        requested.push_back(url);
        return next;
    }
};
