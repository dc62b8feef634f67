/**
 * @file SystemProcessEnumerator.cpp
 * @brief Operating system process enumeration and termination
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * Windows walks a Toolhelp snapshot and uses TerminateProcess. Linux walks
 * /proc and sends SIGKILL, which is enough to exercise the quiescence flow
 * against Wine-hosted game processes.
 */

#include <Migrator/Core/Process.hpp>
#include <Migrator/Core/Logger.hpp>

#ifdef _WIN32
#include <windows.h>
#include <tlhelp32.h>
#else
#include <dirent.h>
#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#include <fstream>
#endif

#include <cctype>
#include <charconv>

namespace Migrator::Core {

bool sameExecutableName(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

namespace {

#ifdef _WIN32

std::string narrow(const wchar_t* wide) {
    int length = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
    if (length <= 0) {
        return std::string();
    }
    std::string result(static_cast<size_t>(length), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, -1, result.data(), length, nullptr, nullptr);
    result.resize(static_cast<size_t>(length - 1));
    return result;
}

class WindowsProcessEnumerator final : public ProcessEnumerator {
public:
    Result<std::vector<ProcessInfo>> listProcesses() override {
        HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
        if (snapshot == INVALID_HANDLE_VALUE) {
            MIGRATOR_LOG_ERROR_F("CreateToolhelp32Snapshot failed with error %lu", GetLastError());
            return ErrorCode::ProcessEnumerationFailed;
        }

        std::vector<ProcessInfo> processes;
        PROCESSENTRY32W pe;
        pe.dwSize = sizeof(pe);

        if (Process32FirstW(snapshot, &pe)) {
            do {
                processes.push_back({static_cast<ProcessId>(pe.th32ProcessID), narrow(pe.szExeFile)});
            } while (Process32NextW(snapshot, &pe));
        } else if (GetLastError() != ERROR_NO_MORE_FILES) {
            CloseHandle(snapshot);
            return ErrorCode::ProcessEnumerationFailed;
        }

        CloseHandle(snapshot);
        return processes;
    }

    Result<void> terminate(ProcessId pid) override {
        HANDLE process = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
        if (process == nullptr) {
            DWORD error = GetLastError();
            if (error == ERROR_INVALID_PARAMETER) {
                // No such process any more
                return Result<void>::Success();
            }
            return error == ERROR_ACCESS_DENIED ? ErrorCode::ProcessAccessDenied
                                                : ErrorCode::ProcessTerminationFailed;
        }

        BOOL terminated = TerminateProcess(process, 1);
        DWORD error = terminated ? ERROR_SUCCESS : GetLastError();
        CloseHandle(process);

        if (!terminated) {
            MIGRATOR_LOG_WARNING_F("TerminateProcess(%u) failed with error %lu", pid, error);
            return error == ERROR_ACCESS_DENIED ? ErrorCode::ProcessAccessDenied
                                                : ErrorCode::ProcessTerminationFailed;
        }

        return Result<void>::Success();
    }
};

#else

bool parsePid(const char* text, ProcessId& pid) {
    const char* end = text;
    while (*end != '\0') {
        ++end;
    }
    auto [ptr, ec] = std::from_chars(text, end, pid);
    return ec == std::errc() && ptr == end && text != end;
}

/// Command name from /proc/<pid>/stat, the text between the outer parentheses
std::string readCommandName(const std::string& pidDir) {
    std::ifstream stat(pidDir + "/stat");
    std::string line;
    if (!stat || !std::getline(stat, line)) {
        return std::string();
    }
    const auto open = line.find('(');
    const auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return std::string();
    }
    return line.substr(open + 1, close - open - 1);
}

class ProcfsProcessEnumerator final : public ProcessEnumerator {
public:
    Result<std::vector<ProcessInfo>> listProcesses() override {
        DIR* proc = opendir("/proc");
        if (proc == nullptr) {
            MIGRATOR_LOG_ERROR_F("opendir(/proc) failed with errno %d", errno);
            return ErrorCode::ProcessEnumerationFailed;
        }

        std::vector<ProcessInfo> processes;
        while (struct dirent* entry = readdir(proc)) {
            ProcessId pid = 0;
            if (!parsePid(entry->d_name, pid)) {
                continue;
            }
            // Processes may exit between readdir and the stat read
            std::string name = readCommandName(std::string("/proc/") + entry->d_name);
            if (!name.empty()) {
                processes.push_back({pid, std::move(name)});
            }
        }

        closedir(proc);
        return processes;
    }

    Result<void> terminate(ProcessId pid) override {
        if (kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
            if (errno == ESRCH) {
                return Result<void>::Success();
            }
            return errno == EPERM ? ErrorCode::ProcessAccessDenied
                                  : ErrorCode::ProcessTerminationFailed;
        }
        return Result<void>::Success();
    }
};

#endif

} // anonymous namespace

std::unique_ptr<ProcessEnumerator> createSystemProcessEnumerator() {
#ifdef _WIN32
    return std::make_unique<WindowsProcessEnumerator>();
#else
    return std::make_unique<ProcfsProcessEnumerator>();
#endif
}

} // namespace Migrator::Core
