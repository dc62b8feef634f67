/**
 * @file KeyStore.cpp
 * @brief Windows registry key store
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/KeyStore.hpp>
#include <Migrator/Core/Logger.hpp>

#ifdef _WIN32
#include <windows.h>
#endif

namespace Migrator::Core {

namespace {

#ifdef _WIN32

std::wstring toWide(const std::string& text) {
    int length = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, nullptr, 0);
    if (length <= 0) {
        return std::wstring();
    }
    std::wstring wide(static_cast<size_t>(length), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, wide.data(), length);
    wide.resize(static_cast<size_t>(length - 1));
    return wide;
}

std::string narrow(const std::wstring& wide) {
    int length = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), -1, nullptr, 0, nullptr, nullptr);
    if (length <= 0) {
        return std::string();
    }
    std::string result(static_cast<size_t>(length), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), -1, result.data(), length, nullptr, nullptr);
    result.resize(static_cast<size_t>(length - 1));
    return result;
}

HKEY rootKey(RegistryHive hive) {
    return hive == RegistryHive::LocalMachine ? HKEY_LOCAL_MACHINE : HKEY_CURRENT_USER;
}

ErrorCode mapRegistryError(LSTATUS status) {
    return status == ERROR_FILE_NOT_FOUND || status == ERROR_PATH_NOT_FOUND
        ? ErrorCode::RegistryKeyNotFound
        : ErrorCode::RegistryAccessFailed;
}

class RegistryKeyStore final : public KeyStore {
public:
    Result<void> setDWords(RegistryHive hive, const std::string& path,
                           const std::vector<DWordValue>& values) override {
        HKEY key = nullptr;
        LSTATUS status = RegOpenKeyExW(rootKey(hive), toWide(path).c_str(), 0, KEY_SET_VALUE, &key);
        if (status != ERROR_SUCCESS) {
            return mapRegistryError(status);
        }

        for (const auto& [name, value] : values) {
            DWORD data = value;
            status = RegSetValueExW(key, toWide(name).c_str(), 0, REG_DWORD,
                                    reinterpret_cast<const BYTE*>(&data), sizeof(data));
            if (status != ERROR_SUCCESS) {
                MIGRATOR_LOG_ERROR_F("RegSetValueExW(%s) failed with status %ld", name.c_str(), status);
                RegCloseKey(key);
                return ErrorCode::RegistryAccessFailed;
            }
        }

        RegCloseKey(key);
        return Result<void>::Success();
    }

    Result<std::string> readString(RegistryHive hive, const std::string& path,
                                   const std::string& name) override {
        HKEY key = nullptr;
        LSTATUS status = RegOpenKeyExW(rootKey(hive), toWide(path).c_str(), 0, KEY_READ, &key);
        if (status != ERROR_SUCCESS) {
            return mapRegistryError(status);
        }

        wchar_t buffer[MAX_PATH];
        DWORD bufferSize = sizeof(buffer);
        DWORD type = REG_SZ;
        status = RegQueryValueExW(key, toWide(name).c_str(), nullptr, &type,
                                  reinterpret_cast<LPBYTE>(buffer), &bufferSize);
        RegCloseKey(key);

        if (status != ERROR_SUCCESS) {
            return mapRegistryError(status);
        }
        if (type != REG_SZ && type != REG_EXPAND_SZ) {
            return ErrorCode::RegistryAccessFailed;
        }

        // REG_SZ data is not guaranteed to be terminated
        size_t chars = bufferSize / sizeof(wchar_t);
        while (chars > 0 && buffer[chars - 1] == L'\0') {
            --chars;
        }
        return narrow(std::wstring(buffer, chars));
    }
};

#else

class AbsentKeyStore final : public KeyStore {
public:
    Result<void> setDWords(RegistryHive, const std::string& path,
                           const std::vector<DWordValue>&) override {
        MIGRATOR_LOG_DEBUG_F("No registry on this platform, key '%s' is absent", path.c_str());
        return ErrorCode::RegistryKeyNotFound;
    }

    Result<std::string> readString(RegistryHive, const std::string&,
                                   const std::string&) override {
        return ErrorCode::RegistryKeyNotFound;
    }
};

#endif

} // anonymous namespace

std::unique_ptr<KeyStore> createSystemKeyStore() {
#ifdef _WIN32
    return std::make_unique<RegistryKeyStore>();
#else
    return std::make_unique<AbsentKeyStore>();
#endif
}

} // namespace Migrator::Core
