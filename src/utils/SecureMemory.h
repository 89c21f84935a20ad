// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Secure memory handling utilities
 *
 * Wiping helpers and RAII wrappers for the buffers that hold random draws,
 * digests and generated secrets, so nothing sensitive outlives its use.
 */

#ifndef PULSAR_SECURE_MEMORY_H
#define PULSAR_SECURE_MEMORY_H

#include <memory>
#include <span>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/crypto.h>

namespace Pulsar {

/**
 * @brief Custom deleter for EVP_MD_CTX that frees the digest context
 */
struct EVPDigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

/**
 * @brief RAII wrapper for EVP_MD_CTX
 *
 * @code
 * EVPDigestContextPtr ctx(EVP_MD_CTX_new());
 * if (!ctx) {
 *     return std::unexpected(GeneratorError::HashFailed);
 * }
 * EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr);
 * @endcode
 */
using EVPDigestContextPtr = std::unique_ptr<EVP_MD_CTX, EVPDigestContextDeleter>;

/**
 * @brief Secure allocator for std::vector that zeros memory on deallocation
 *
 * @tparam T Element type (uint32_t for random draws, uint8_t for digests)
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

/**
 * @brief std::vector whose storage is wiped when released
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief Securely clear a span of trivially-copyable values
 * @param data Memory to overwrite with zeros
 */
template<typename T>
inline void secure_clear(std::span<T> data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size_bytes());
    }
}

/**
 * @brief Securely clear a std::string holding a secret and empty it
 *
 * @note Use this instead of assigning "" so the old characters are
 *       overwritten rather than left in the freed buffer.
 */
inline void secure_clear(std::string& str) noexcept {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

/**
 * @brief RAII wrapper for a generated secret
 *
 * Holds a password or passphrase and wipes it on scope exit. Move-only.
 *
 * @code
 * SecureString secret{generator.generate(20, options)};
 * std::cout << secret.get() << '\n';
 * // Wiped here
 * @endcode
 */
class SecureString {
public:
    explicit SecureString(std::string str) : str_(std::move(str)) {}

    ~SecureString() {
        secure_clear(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear(str_);
            str_ = std::move(other.str_);
            secure_clear(other.str_);
        }
        return *this;
    }

    [[nodiscard]] const std::string& get() const noexcept {
        return str_;
    }

    void clear() noexcept {
        secure_clear(str_);
    }

    [[nodiscard]] bool empty() const noexcept {
        return str_.empty();
    }

    [[nodiscard]] size_t size() const noexcept {
        return str_.size();
    }

private:
    std::string str_;
};

} // namespace Pulsar

#endif // PULSAR_SECURE_MEMORY_H
