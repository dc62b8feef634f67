/**
 * @file BinaryFile.cpp
 * @brief Whole-file read/rewrite access implementation
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/BinaryFile.hpp>
#include <Migrator/Core/Logger.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <sys/file.h>
#include <sys/stat.h>
#endif

#include <algorithm>
#include <utility>

namespace Migrator {
namespace Core {
namespace Binary {

namespace {

#ifdef _WIN32
std::wstring toWide(const std::string& path) {
    int length = MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, nullptr, 0);
    if (length <= 0) {
        return std::wstring();
    }
    std::wstring wide(static_cast<size_t>(length), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, wide.data(), length);
    wide.resize(static_cast<size_t>(length - 1));
    return wide;
}

ErrorCode mapOpenError(DWORD error) {
    switch (error) {
        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND:
            return ErrorCode::FileNotFound;
        case ERROR_ACCESS_DENIED:
            return ErrorCode::FileAccessDenied;
        case ERROR_SHARING_VIOLATION:
        case ERROR_LOCK_VIOLATION:
            return ErrorCode::FileLocked;
        default:
            return ErrorCode::IOError;
    }
}
#else
ErrorCode mapOpenError(int error) {
    switch (error) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::FileAccessDenied;
        case ETXTBSY:
            // Image of a running executable
            return ErrorCode::FileLocked;
        default:
            return ErrorCode::IOError;
    }
}
#endif

} // anonymous namespace

BinaryFile::BinaryFile(std::string path, NativeHandle handle, bool writable) noexcept
    : m_path(std::move(path))
    , m_handle(handle)
    , m_writable(writable) {}

BinaryFile::BinaryFile(BinaryFile&& other) noexcept
    : m_path(std::move(other.m_path))
    , m_handle(other.m_handle)
    , m_writable(other.m_writable) {
#ifdef _WIN32
    other.m_handle = INVALID_HANDLE_VALUE;
#else
    other.m_handle = -1;
#endif
}

BinaryFile& BinaryFile::operator=(BinaryFile&& other) noexcept {
    if (this != &other) {
        close();
        m_path = std::move(other.m_path);
        m_handle = other.m_handle;
        m_writable = other.m_writable;
#ifdef _WIN32
        other.m_handle = INVALID_HANDLE_VALUE;
#else
        other.m_handle = -1;
#endif
    }
    return *this;
}

BinaryFile::~BinaryFile() {
    close();
}

#ifdef _WIN32

// ============================================================================
// Windows implementation
// ============================================================================

Result<BinaryFile> BinaryFile::open(const std::string& path, bool exclusiveLock) {
    std::wstring widePath = toWide(path);
    if (widePath.empty()) {
        return ErrorCode::InvalidPath;
    }

    // No sharing at all is the Windows equivalent of an exclusive lock
    DWORD shareMode = exclusiveLock ? 0 : FILE_SHARE_READ;
    HANDLE handle = CreateFileW(
        widePath.c_str(),
        GENERIC_READ | GENERIC_WRITE,
        shareMode,
        nullptr,
        OPEN_EXISTING,
        FILE_ATTRIBUTE_NORMAL,
        nullptr
    );

    if (handle == INVALID_HANDLE_VALUE) {
        DWORD error = GetLastError();
        MIGRATOR_LOG_DEBUG_F("CreateFileW(%s) failed with error %lu", path.c_str(), error);
        return mapOpenError(error);
    }

    return BinaryFile(path, handle, true);
}

Result<BinaryFile> BinaryFile::openReadOnly(const std::string& path) {
    std::wstring widePath = toWide(path);
    if (widePath.empty()) {
        return ErrorCode::InvalidPath;
    }

    HANDLE handle = CreateFileW(
        widePath.c_str(),
        GENERIC_READ,
        FILE_SHARE_READ | FILE_SHARE_WRITE,
        nullptr,
        OPEN_EXISTING,
        FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN,
        nullptr
    );

    if (handle == INVALID_HANDLE_VALUE) {
        return mapOpenError(GetLastError());
    }

    return BinaryFile(path, handle, false);
}

void BinaryFile::close() noexcept {
    if (m_handle != INVALID_HANDLE_VALUE && m_handle != nullptr) {
        CloseHandle(m_handle);
    }
    m_handle = INVALID_HANDLE_VALUE;
}

Result<uint64_t> BinaryFile::size() const {
    LARGE_INTEGER fileSize;
    if (!GetFileSizeEx(m_handle, &fileSize)) {
        return ErrorCode::FileReadError;
    }
    return static_cast<uint64_t>(fileSize.QuadPart);
}

Result<ByteBuffer> BinaryFile::readAll() {
    auto sizeResult = size();
    if (sizeResult.isFailure()) {
        return sizeResult.error();
    }
    if (sizeResult.value() > MAX_FILE_SIZE) {
        return ErrorCode::FileTooLarge;
    }

    LARGE_INTEGER zero{};
    if (!SetFilePointerEx(m_handle, zero, nullptr, FILE_BEGIN)) {
        return ErrorCode::FileReadError;
    }

    ByteBuffer data(static_cast<size_t>(sizeResult.value()));
    size_t total = 0;
    while (total < data.size()) {
        DWORD bytesRead = 0;
        DWORD chunk = static_cast<DWORD>(std::min<size_t>(data.size() - total, 1u << 30));
        if (!ReadFile(m_handle, data.data() + total, chunk, &bytesRead, nullptr)) {
            return ErrorCode::FileReadError;
        }
        if (bytesRead == 0) {
            return ErrorCode::FileReadError;
        }
        total += bytesRead;
    }

    return data;
}

Result<void> BinaryFile::writeAll(ByteSpan content) {
    if (!m_writable) {
        return ErrorCode::InvalidState;
    }

    auto sizeResult = size();
    if (sizeResult.isFailure()) {
        return sizeResult.error();
    }
    if (sizeResult.value() != content.size()) {
        return ErrorCode::InvalidArgument;
    }

    LARGE_INTEGER zero{};
    if (!SetFilePointerEx(m_handle, zero, nullptr, FILE_BEGIN)) {
        return ErrorCode::FileWriteError;
    }

    // Same single-write contract as the POSIX path
    if (content.size() > MAXDWORD) {
        return ErrorCode::FileTooLarge;
    }
    DWORD written = 0;
    if (!WriteFile(m_handle, content.data(), static_cast<DWORD>(content.size()), &written, nullptr)) {
        MIGRATOR_LOG_ERROR_F("WriteFile(%s) failed with error %lu", m_path.c_str(), GetLastError());
        return ErrorCode::FileWriteError;
    }
    if (written != content.size()) {
        MIGRATOR_LOG_CRITICAL_F("%s partially rewritten (%lu of %zu bytes)",
                                m_path.c_str(), written, content.size());
        return ErrorCode::FileWriteError;
    }

    if (!FlushFileBuffers(m_handle)) {
        return ErrorCode::FileWriteError;
    }

    return Result<void>::Success();
}

#else

// ============================================================================
// POSIX implementation
// ============================================================================

Result<BinaryFile> BinaryFile::open(const std::string& path, bool exclusiveLock) {
    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        int error = errno;
        MIGRATOR_LOG_DEBUG_F("open(%s) failed with errno %d", path.c_str(), error);
        return mapOpenError(error);
    }

    if (exclusiveLock && flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        ::close(fd);
        return error == EWOULDBLOCK ? ErrorCode::FileLocked : ErrorCode::IOError;
    }

    return BinaryFile(path, fd, true);
}

Result<BinaryFile> BinaryFile::openReadOnly(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return mapOpenError(errno);
    }
    return BinaryFile(path, fd, false);
}

void BinaryFile::close() noexcept {
    if (m_handle >= 0) {
        // Closing the descriptor also releases the flock
        ::close(m_handle);
    }
    m_handle = -1;
}

Result<uint64_t> BinaryFile::size() const {
    struct stat st;
    if (fstat(m_handle, &st) < 0) {
        return ErrorCode::FileReadError;
    }
    if (!S_ISREG(st.st_mode)) {
        return ErrorCode::InvalidPath;
    }
    return static_cast<uint64_t>(st.st_size);
}

Result<ByteBuffer> BinaryFile::readAll() {
    auto sizeResult = size();
    if (sizeResult.isFailure()) {
        return sizeResult.error();
    }
    if (sizeResult.value() > MAX_FILE_SIZE) {
        return ErrorCode::FileTooLarge;
    }

    ByteBuffer data(static_cast<size_t>(sizeResult.value()));
    size_t total = 0;
    while (total < data.size()) {
        ssize_t bytesRead = pread(m_handle, data.data() + total, data.size() - total,
                                  static_cast<off_t>(total));
        if (bytesRead < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ErrorCode::FileReadError;
        }
        if (bytesRead == 0) {
            // File shrank underneath us
            return ErrorCode::FileReadError;
        }
        total += static_cast<size_t>(bytesRead);
    }

    return data;
}

Result<void> BinaryFile::writeAll(ByteSpan content) {
    if (!m_writable) {
        return ErrorCode::InvalidState;
    }

    auto sizeResult = size();
    if (sizeResult.isFailure()) {
        return sizeResult.error();
    }
    if (sizeResult.value() != content.size()) {
        return ErrorCode::InvalidArgument;
    }

    // In-place rewrite with a single write call. A short write has already
    // changed part of the file, so it is reported instead of resumed.
    ssize_t written;
    do {
        written = pwrite(m_handle, content.data(), content.size(), 0);
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        MIGRATOR_LOG_ERROR_F("pwrite(%s) failed with errno %d", m_path.c_str(), errno);
        return ErrorCode::FileWriteError;
    }
    if (static_cast<size_t>(written) != content.size()) {
        MIGRATOR_LOG_CRITICAL_F("%s partially rewritten (%zd of %zu bytes)",
                                m_path.c_str(), written, content.size());
        return ErrorCode::FileWriteError;
    }

    if (fsync(m_handle) != 0) {
        return ErrorCode::FileWriteError;
    }

    return Result<void>::Success();
}

#endif

} // namespace Binary
} // namespace Core
} // namespace Migrator
