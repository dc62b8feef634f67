/**
 * @file BinaryFile.hpp
 * @brief Whole-file read/rewrite access to an executable on disk
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * A BinaryFile keeps one read-write handle open for its lifetime. The content
 * is read in full, transformed in memory by the caller and written back in
 * full through the same handle, so the file is never recreated and keeps its
 * permissions, ownership and timestamps other than mtime.
 */

#pragma once

#ifndef MIGRATOR_CORE_BINARY_FILE_HPP
#define MIGRATOR_CORE_BINARY_FILE_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <string>

namespace Migrator {
namespace Core {
namespace Binary {

/**
 * @brief RAII handle over a file opened for in-place rewriting
 */
class BinaryFile {
public:
    /// Files above this size are refused (BF2 binaries are a few MB)
    static constexpr size_t MAX_FILE_SIZE = 256 * 1024 * 1024;

    /**
     * @brief Open an existing file for reading and writing
     * @param path File to open
     * @param exclusiveLock Take an exclusive lock for the handle's lifetime
     * @return Open handle, or FileNotFound / FileAccessDenied / FileLocked / IOError
     */
    [[nodiscard]] static Result<BinaryFile> open(const std::string& path, bool exclusiveLock);

    /**
     * @brief Open an existing file for reading only
     */
    [[nodiscard]] static Result<BinaryFile> openReadOnly(const std::string& path);

    BinaryFile(BinaryFile&& other) noexcept;
    BinaryFile& operator=(BinaryFile&& other) noexcept;
    BinaryFile(const BinaryFile&) = delete;
    BinaryFile& operator=(const BinaryFile&) = delete;
    ~BinaryFile();

    /**
     * @brief Read the whole file from offset 0
     */
    [[nodiscard]] Result<ByteBuffer> readAll();

    /**
     * @brief Overwrite the file from offset 0 with @p content and flush
     *
     * The content must have exactly the current file size; anything else is
     * rejected with InvalidArgument and nothing is written.
     */
    [[nodiscard]] Result<void> writeAll(ByteSpan content);

    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

    [[nodiscard]] bool isWritable() const noexcept { return m_writable; }

private:
#ifdef _WIN32
    using NativeHandle = void*;
#else
    using NativeHandle = int;
#endif

    BinaryFile(std::string path, NativeHandle handle, bool writable) noexcept;

    void close() noexcept;

    [[nodiscard]] Result<uint64_t> size() const;

    std::string m_path;
    NativeHandle m_handle;
    bool m_writable;
};

} // namespace Binary
} // namespace Core
} // namespace Migrator

#endif // MIGRATOR_CORE_BINARY_FILE_HPP
