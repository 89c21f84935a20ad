// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "BreachChecker.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"
#include "../../utils/StringHelpers.h"
#include <openssl/evp.h>
#include <array>
#include <charconv>

namespace Pulsar {

BreachChecker::BreachChecker(IHttpClient& client, std::chrono::milliseconds timeout)
    : m_client(client),
      m_timeout(timeout) {
}

uint64_t BreachChecker::check_breach(std::string_view candidate) {
    auto result = try_check_breach(candidate);
    if (result) {
        return *result;
    }

    ++m_fail_open_count;
    Log::warning("BreachChecker: Check failed open, treating as not found ({}, {} failures so far)",
                 to_string(result.error()), m_fail_open_count.load());
    m_signal_fail_open.emit(result.error());
    return 0;
}

GeneratorResult<uint64_t> BreachChecker::try_check_breach(std::string_view candidate) {
    if (candidate.empty()) {
        return 0;
    }

    auto hash = sha1_hex(candidate);
    if (!hash) {
        return std::unexpected(hash.error());
    }

    const std::string prefix = hash->substr(0, PREFIX_LENGTH);
    const std::string suffix = hash->substr(PREFIX_LENGTH);
    secure_clear(*hash);

    auto response = m_client.get(std::string(RANGE_ENDPOINT) + prefix, m_timeout);
    if (!response) {
        return std::unexpected(response.error());
    }

    if (!response->ok()) {
        Log::error("BreachChecker: Range API returned HTTP {}", response->status);
        return std::unexpected(GeneratorError::HttpStatusError);
    }

    return parse_range_response(response->body, suffix);
}

GeneratorResult<std::string> BreachChecker::sha1_hex(std::string_view input) {
    EVPDigestContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::unexpected(GeneratorError::HashFailed);
    }

    // SHA-1 is dictated by the range API protocol, not used for secrecy
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        return std::unexpected(GeneratorError::HashFailed);
    }

    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return std::unexpected(GeneratorError::HashFailed);
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 || digest_len != 20) {
        secure_clear(std::span<unsigned char>(digest));
        return std::unexpected(GeneratorError::HashFailed);
    }

    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(HEX[digest[i] >> 4]);
        hex.push_back(HEX[digest[i] & 0x0F]);
    }

    secure_clear(std::span<unsigned char>(digest));
    return hex;
}

GeneratorResult<uint64_t>
BreachChecker::parse_range_response(std::string_view body, std::string_view suffix) {
    for (std::string_view line : split(body, '\n')) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }

        if (trim(line.substr(0, colon)) != suffix) {
            continue;
        }

        const std::string_view count_text = trim(line.substr(colon + 1));
        uint64_t count = 0;
        const auto [end, ec] = std::from_chars(count_text.data(), count_text.data() + count_text.size(), count);
        if (ec != std::errc{} || end != count_text.data() + count_text.size() || count_text.empty()) {
            Log::warning("BreachChecker: Malformed count in range response");
            return std::unexpected(GeneratorError::InvalidResponse);
        }
        return count;
    }

    return 0;
}

} // namespace Pulsar
