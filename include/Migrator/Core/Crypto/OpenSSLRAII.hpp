/**
 * @file OpenSSLRAII.hpp
 * @brief Scoped ownership of OpenSSL digest contexts
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * Usage Pattern:
 * @code
 * EVPMDCtxPtr ctx(EVP_MD_CTX_new());
 * if (!ctx) {
 *     return ErrorCode::CryptoError;
 * }
 * EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
 * // EVP_MD_CTX_free() runs on every exit path
 * @endcode
 */

#pragma once

#ifndef MIGRATOR_CRYPTO_OPENSSL_RAII_HPP
#define MIGRATOR_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/evp.h>
#include <utility>

namespace Migrator::Crypto {

/**
 * @brief Unique owner of an OpenSSL object freed through @p Deleter
 *
 * @tparam T OpenSSL object type (e.g. EVP_MD_CTX)
 * @tparam Deleter OpenSSL free function for that type
 */
template<typename T, void (*Deleter)(T*)>
class OpenSSLRAII {
public:
    explicit OpenSSLRAII(T* ptr = nullptr) noexcept
        : m_ptr(ptr) {
    }

    ~OpenSSLRAII() noexcept {
        reset();
    }

    OpenSSLRAII(const OpenSSLRAII&) = delete;
    OpenSSLRAII& operator=(const OpenSSLRAII&) = delete;

    OpenSSLRAII(OpenSSLRAII&& other) noexcept
        : m_ptr(other.m_ptr) {
        other.m_ptr = nullptr;
    }

    OpenSSLRAII& operator=(OpenSSLRAII&& other) noexcept {
        if (this != &other) {
            reset();
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }

    /// Free the held object and take ownership of @p ptr
    void reset(T* ptr = nullptr) noexcept {
        if (m_ptr != nullptr) {
            Deleter(m_ptr);
        }
        m_ptr = ptr;
    }

    [[nodiscard]] T* get() const noexcept {
        return m_ptr;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return m_ptr != nullptr;
    }

    /// Implicit conversion for passing straight into OpenSSL calls
    operator T*() const noexcept {
        return m_ptr;
    }

private:
    T* m_ptr;
};

/// Message digest context (EVP_MD_CTX_free on scope exit)
using EVPMDCtxPtr = OpenSSLRAII<EVP_MD_CTX, EVP_MD_CTX_free>;

} // namespace Migrator::Crypto

#endif // MIGRATOR_CRYPTO_OPENSSL_RAII_HPP
