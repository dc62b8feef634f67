/**
 * @file HashEngine.cpp
 * @brief SHA-256 hash engine implementation using OpenSSL EVP API
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/Crypto.hpp>
#include <Migrator/Core/Crypto/OpenSSLRAII.hpp>
#include <Migrator/Core/Logger.hpp>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <iomanip>
#include <sstream>

namespace Migrator::Crypto {

namespace {

void logOpenSSLError(const char* operation) {
    unsigned long err = ERR_get_error();
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    MIGRATOR_LOG_ERROR_F("%s failed: %s", operation, buffer);
}

} // anonymous namespace

// ============================================================================
// HashEngine::Impl - OpenSSL EVP implementation
// ============================================================================

class HashEngine::Impl {
public:
    Impl()
        : m_ctx(EVP_MD_CTX_new())
        , m_finalized(false)
    {
    }

    Result<void> init() {
        if (!m_ctx) {
            return ErrorCode::CryptoError;
        }

        if (EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) != 1) {
            logOpenSSLError("EVP_DigestInit_ex");
            return ErrorCode::CryptoError;
        }

        m_finalized = false;
        return Result<void>::Success();
    }

    Result<void> update(ByteSpan data) {
        if (!m_ctx) {
            return ErrorCode::CryptoError;
        }

        if (m_finalized) {
            return ErrorCode::InvalidState;
        }

        if (data.empty()) {
            return Result<void>::Success();
        }

        if (EVP_DigestUpdate(m_ctx, data.data(), data.size()) != 1) {
            logOpenSSLError("EVP_DigestUpdate");
            return ErrorCode::CryptoError;
        }

        return Result<void>::Success();
    }

    Result<SHA256Hash> finalize() {
        if (!m_ctx) {
            return ErrorCode::CryptoError;
        }

        if (m_finalized) {
            return ErrorCode::InvalidState;
        }

        SHA256Hash hash{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(m_ctx, hash.data(), &len) != 1) {
            logOpenSSLError("EVP_DigestFinal_ex");
            return ErrorCode::CryptoError;
        }

        if (len != hash.size()) {
            return ErrorCode::CryptoError;
        }

        m_finalized = true;
        return hash;
    }

private:
    EVPMDCtxPtr m_ctx;
    bool m_finalized;
};

// ============================================================================
// HashEngine - Public API
// ============================================================================

HashEngine::HashEngine()
    : m_impl(std::make_unique<Impl>()) {
}

HashEngine::~HashEngine() = default;

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    HashEngine engine;
    MIGRATOR_TRY(engine.init());
    MIGRATOR_TRY(engine.update(data));
    return engine.finalize();
}

Result<void> HashEngine::init() {
    return m_impl->init();
}

Result<void> HashEngine::update(ByteSpan data) {
    return m_impl->update(data);
}

Result<SHA256Hash> HashEngine::finalize() {
    return m_impl->finalize();
}

// ============================================================================
// Hex Encoding
// ============================================================================

std::string toHex(ByteSpan data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (Byte b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }

    return oss.str();
}

} // namespace Migrator::Crypto
