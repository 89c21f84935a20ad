// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file HttpClient.h
 * @brief Minimal HTTPS GET client used by the breach checker
 */

#pragma once

#include "../GeneratorError.h"
#include <chrono>
#include <string>

namespace Pulsar {

/**
 * @brief Response of a completed request (any status code)
 */
struct HttpResponse {
    long status = 0;
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Interface for HTTP GET requests
 *
 * Transport failures are errors; a completed request with a non-2xx status
 * is a successful call returning that status.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform a GET request
     * @param url Absolute https URL
     * @param timeout Bound on the whole request (connect + transfer)
     * @return Response, or NetworkError / Timeout
     */
    [[nodiscard]] virtual GeneratorResult<HttpResponse>
    get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief libcurl implementation of IHttpClient
 *
 * TLS peer and host verification stay enabled, redirects are not followed,
 * and signals are disabled so the client is usable off the main thread.
 */
class CurlHttpClient final : public IHttpClient {
public:
    /**
     * @param user_agent Value of the User-Agent header
     */
    explicit CurlHttpClient(std::string user_agent);

    [[nodiscard]] GeneratorResult<HttpResponse>
    get(const std::string& url, std::chrono::milliseconds timeout) override;

private:
    std::string m_user_agent;
};

} // namespace Pulsar
