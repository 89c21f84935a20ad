// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "HttpClient.h"
#include "../../utils/Log.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace Pulsar {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

// curl_global_init is not thread-safe and must run once per process
bool ensure_curl_initialized() {
    static std::once_flag once;
    static bool initialized = false;
    std::call_once(once, [] {
        initialized = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
        if (!initialized) {
            Log::error("CurlHttpClient: curl_global_init failed");
        }
    });
    return initialized;
}

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

} // anonymous namespace

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : m_user_agent(std::move(user_agent)) {
}

GeneratorResult<HttpResponse>
CurlHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
    if (!ensure_curl_initialized()) {
        return std::unexpected(GeneratorError::NetworkError);
    }

    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        Log::error("CurlHttpClient: curl_easy_init failed");
        return std::unexpected(GeneratorError::NetworkError);
    }

    HttpResponse response;
    const long timeout_ms = static_cast<long>(timeout.count());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, m_user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        Log::warning("CurlHttpClient: Request timed out after {} ms", timeout_ms);
        return std::unexpected(GeneratorError::Timeout);
    }
    if (rc != CURLE_OK) {
        Log::warning("CurlHttpClient: Request failed: {}", curl_easy_strerror(rc));
        return std::unexpected(GeneratorError::NetworkError);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace Pulsar
