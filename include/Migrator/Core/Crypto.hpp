/**
 * @file Crypto.hpp
 * @brief Content digests for patched executables
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * SHA-256 digests are recorded before and after each patch so a report can
 * prove which exact file content was transformed into which.
 */

#pragma once

#ifndef MIGRATOR_CORE_CRYPTO_HPP
#define MIGRATOR_CORE_CRYPTO_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <memory>
#include <string>

namespace Migrator::Crypto {

/**
 * @brief SHA-256 engine over the OpenSSL EVP API
 *
 * @example
 * ```cpp
 * // One-shot
 * auto digest = HashEngine::sha256(content);
 *
 * // Streaming
 * HashEngine hasher;
 * hasher.init();
 * hasher.update(chunk1);
 * hasher.update(chunk2);
 * auto digest = hasher.finalize();
 * ```
 */
class HashEngine {
public:
    HashEngine();
    ~HashEngine();

    HashEngine(const HashEngine&) = delete;
    HashEngine& operator=(const HashEngine&) = delete;

    /**
     * @brief Compute the SHA-256 digest of a buffer
     * @param data Data to hash
     * @return Digest or CryptoError
     */
    static Result<SHA256Hash> sha256(ByteSpan data);

    /**
     * @brief Start a new streaming digest
     */
    Result<void> init();

    /**
     * @brief Feed data into the running digest
     * @return InvalidState after finalize() until the next init()
     */
    Result<void> update(ByteSpan data);

    /**
     * @brief Finish the running digest
     */
    Result<SHA256Hash> finalize();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Lowercase hexadecimal rendering of bytes
 */
std::string toHex(ByteSpan data);

} // namespace Migrator::Crypto

#endif // MIGRATOR_CORE_CRYPTO_HPP
