// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file RandomSource.h
 * @brief Source of uniformly random 32-bit values for the generators
 *
 * Generators only consume this interface. Production code uses the OpenSSL
 * DRBG; tests inject a fixed sequence so the index arithmetic of the
 * generators can be checked exactly.
 */

#pragma once

#include "../GeneratorError.h"
#include <cstdint>
#include <span>

namespace Pulsar {

/**
 * @brief Interface for random value providers
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Fill a buffer with independent uniform 32-bit values
     * @param out Destination buffer
     * @return void on success, RandomSourceFailed on failure
     *
     * @note On failure the contents of @p out are unspecified
     */
    [[nodiscard]] virtual GeneratorResult<void> fill(std::span<uint32_t> out) = 0;
};

/**
 * @brief Cryptographically secure random source backed by OpenSSL RAND_bytes
 *
 * Thread-safety: OpenSSL's public DRBG is thread-safe, so one instance can be
 * shared.
 */
class OpenSslRandomSource final : public IRandomSource {
public:
    [[nodiscard]] GeneratorResult<void> fill(std::span<uint32_t> out) override;

    /**
     * @brief Process-wide instance used when no source is injected
     */
    [[nodiscard]] static OpenSslRandomSource& instance();
};

} // namespace Pulsar
