// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "RandomSource.h"
#include "../../utils/Log.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>

namespace Pulsar {

GeneratorResult<void> OpenSslRandomSource::fill(std::span<uint32_t> out) {
    if (out.empty()) {
        return {};
    }

    if (out.size_bytes() > static_cast<size_t>(INT_MAX)) {
        Log::error("OpenSslRandomSource: Request too large ({} bytes)", out.size_bytes());
        return std::unexpected(GeneratorError::RandomSourceFailed);
    }

    // FIPS-approved DRBG
    if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()),
                   static_cast<int>(out.size_bytes())) != 1) {
        Log::error("OpenSslRandomSource: RAND_bytes failed (error {})", ERR_get_error());
        return std::unexpected(GeneratorError::RandomSourceFailed);
    }

    return {};
}

OpenSslRandomSource& OpenSslRandomSource::instance() {
    static OpenSslRandomSource source;
    return source;
}

} // namespace Pulsar
