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
#include <curl/curl.h>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <cstdint>
#include <memory>

using std::string;
using std::runtime_error;

namespace utils {

const char USER_AGENT[] = "powerline-risk/1.0 (+https://wiki.openstreetmap.org/wiki/Overpass_API)";

// status line and payload of a finished request
struct HttpResponse {
    uint16_t status = 0;
    string body;
};

// GET-only transport; tests swap in a fake
struct IHttpClient {
    virtual ~IHttpClient() = default;
    virtual HttpResponse get(const string& url) = 0;
};

// libcurl backed client. One easy handle per request, global state is set up
// and torn down with the client.
class CurlHttpClient : public IHttpClient {
 public:
    // Args:
    //    timeoutSeconds: limit for a whole transfer, 0 disables it
    explicit CurlHttpClient(long timeoutSeconds = 60) : timeoutSeconds_(timeoutSeconds) {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw runtime_error("curl_global_init failed");
        }
    }

    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // Fetches url, following redirects. Overpass answers are large JSON
    // documents so compressed transfer is requested.
    //
    // Args:
    //    url: full request URL, query string already encoded
    // Returns:
    //    status code and body, whatever the status
    // Throws:
    //    runtime_error on transport failures (DNS, connect, timeout, ...)
    HttpResponse get(const string& url) override {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
        if (!handle) throw runtime_error("curl_easy_init failed");
        CURL* curl = handle.get();

        HttpResponse resp;
        char errorBuffer[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);

        const CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::ostringstream oss;
            oss << "CURL error for " << url << ": "
                << (errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res));
            throw runtime_error(oss.str());
        }

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        resp.status = static_cast<uint16_t>(code);
        return resp;
    }

 private:
    // libcurl write callback, userData is the response body string
    static size_t appendBody(char* data, size_t size, size_t nmemb, void* userData) {
        static_cast<string*>(userData)->append(data, size * nmemb);
        return size * nmemb;
    }

    long timeoutSeconds_;
};

// Returns percent-encoded string for use in a query string
//
// Args:
//     s: the string to encode
// Returns:
//    the encoded string, or s unchanged if libcurl can't encode it
inline string urlEncode(const string& s) {
    char* out = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
    if (!out) return s;
    string encoded(out);
    curl_free(out);
    return encoded;
}

// HTTP GET that only accepts 2xx responses
//
// Args:
//    client: the HTTP client to use
//    url: the url to fetch
// Returns:
//    the response body
// Throws:
//    runtime_error for non-2xx statuses, client errors are passed on
inline string httpGet(IHttpClient& client, const string& url) {
    HttpResponse resp = client.get(url);
    if (resp.status < 200 || resp.status >= 300) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status << " for URL: " << url;
        throw runtime_error(oss.str());
    }
    return std::move(resp.body);
}

}  // namespace utils
