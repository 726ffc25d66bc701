#pragma once
// BitsAgent v1.00 - Common Type Definitions
// Windows Native C++ Implementation

// Prevent Windows macro conflicts
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

// Undefine problematic macros after including windows.h
#ifdef ERROR
#undef ERROR
#endif
#ifdef min
#undef min
#endif
#ifdef max
#undef max
#endif

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <atomic>
#include <mutex>
#include <cstdint>

namespace bitsagent {

// Version Information
constexpr const wchar_t* VERSION = L"1.00";

enum class LogLevel : uint8_t {
    LOG_ERROR = 0,   // Always output (critical errors)
    LOG_ALERT = 1,   // ALERT and above (warnings)
    LOG_INFO  = 2,   // INFO and above (normal operation) - default
    LOG_DEBUG = 3    // DEBUG only (development details)
};

// Named pipe namespace (local machine only)
constexpr const wchar_t* PIPE_PREFIX = L"\\\\.\\pipe\\";
constexpr size_t PIPE_ID_HEX_DIGITS = 32;

// File Names
constexpr const wchar_t* CONFIG_FILENAME = L"BitsAgent.ini";
constexpr const wchar_t* WORKER_LOG_FILENAME = L"BitsAgent_Worker.log";
constexpr const wchar_t* CLIENT_LOG_FILENAME = L"BitsAgent_Client.log";
constexpr const wchar_t* WORKER_EXE_FILENAME = L"BitsAgent_Worker.exe";

// Worker command line: <worker> ondemand command-connect <pipe>
constexpr const wchar_t* WORKER_ARG_ONDEMAND = L"ondemand";
constexpr const wchar_t* WORKER_ARG_COMMAND_CONNECT = L"command-connect";

// Default Values
constexpr size_t MAX_LOG_SIZE = 102400;    // 100KB
constexpr size_t MAX_CONFIG_FILE_SIZE = 1048576;
constexpr const wchar_t* DEFAULT_JOB_NAME = L"BitsAgent Transfer";
constexpr DWORD DEFAULT_MINIMUM_RETRY_DELAY_SEC = 60;
constexpr DWORD DEFAULT_MONITOR_INTERVAL_MS = 1000;
constexpr DWORD DEFAULT_MONITOR_WRITE_TIMEOUT_MS = 5000;
constexpr DWORD BITSAGENT_CONTROL_TIMEOUT_MS = 30000;    // connect, handshake, command round trip

// Protocol constants
constexpr uint8_t BITSAGENT_PROTOCOL_VERSION = 0;
constexpr size_t BITSAGENT_MAX_COMMAND = 0x4000;
constexpr size_t BITSAGENT_MAX_RESPONSE = 0x4000;
constexpr DWORD BITSAGENT_PIPE_BUFFER_SIZE = 0x10000;

// Input validation constants
constexpr DWORD BITSAGENT_MIN_INTERVAL_MS = 10;
constexpr DWORD BITSAGENT_MAX_INTERVAL_MS = 24 * 60 * 60 * 1000;
constexpr size_t BITSAGENT_MAX_SAVE_PATH_LEN = 260;
constexpr size_t BITSAGENT_MAX_URL_LEN = 2048;

// Utility: Convert string to lowercase
inline std::wstring ToLower(const std::wstring& str) {
    std::wstring result = str;
    for (auto& ch : result) {
        ch = towlower(ch);
    }
    return result;
}

// Utility: UTF-8 <-> UTF-16
inline std::wstring Utf8ToWide(const std::string& str) {
    if (str.empty()) return L"";

    int size = MultiByteToWideChar(CP_UTF8, 0, str.c_str(),
                                   static_cast<int>(str.size()), nullptr, 0);
    if (size <= 0) return L"";

    std::wstring result(size, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(),
                       static_cast<int>(str.size()), &result[0], size);
    return result;
}

inline std::string WideToUtf8(const std::wstring& str) {
    if (str.empty()) return "";

    int size = WideCharToMultiByte(CP_UTF8, 0, str.c_str(),
                                   static_cast<int>(str.size()),
                                   nullptr, 0, nullptr, nullptr);
    if (size <= 0) return "";

    std::string result(size, '\0');
    WideCharToMultiByte(CP_UTF8, 0, str.c_str(),
                       static_cast<int>(str.size()),
                       &result[0], size, nullptr, nullptr);
    return result;
}

// Save path is joined to the configured prefix, so only a plain file name is accepted
// Blocked: path traversal, absolute paths, directory separators, reserved characters
inline bool IsValidSavePath(const std::wstring& name) {
    if (name.empty() || name.length() > BITSAGENT_MAX_SAVE_PATH_LEN) {
        return false;
    }

    if (name.find(L"..") != std::wstring::npos) {
        return false;
    }

    if (name.length() >= 2) {
        if (name[1] == L':') return false;  // C:\path
    }
    if (name[0] == L'\\' || name[0] == L'/') return false;  // \\server or /path

    for (wchar_t c : name) {
        if (c < 0x20) return false;
        switch (c) {
            case L'\\': case L'/': case L':': case L'*': case L'?':
            case L'"': case L'<': case L'>': case L'|':
                return false;
            default:
                break;
        }
    }

    // Trailing dot or space is silently stripped by the filesystem
    wchar_t last = name.back();
    return last != L'.' && last != L' ';
}

inline bool IsValidUrl(const std::wstring& url) {
    if (url.empty() || url.length() > BITSAGENT_MAX_URL_LEN) {
        return false;
    }
    std::wstring lower = ToLower(url);
    const std::wstring http = L"http://";
    const std::wstring https = L"https://";
    if (lower.compare(0, https.size(), https) == 0) {
        return lower.size() > https.size();
    }
    if (lower.compare(0, http.size(), http) == 0) {
        return lower.size() > http.size();
    }
    return false;
}

inline bool IsValidUpdateInterval(uint32_t intervalMs) {
    return intervalMs >= BITSAGENT_MIN_INTERVAL_MS && intervalMs <= BITSAGENT_MAX_INTERVAL_MS;
}

// Pipe identifiers are generated as 32 lowercase hex digits
inline bool IsValidPipeName(const std::wstring& name) {
    if (name.length() != PIPE_ID_HEX_DIGITS) {
        return false;
    }
    for (wchar_t c : name) {
        bool digit = (c >= L'0' && c <= L'9');
        bool hex = (c >= L'a' && c <= L'f');
        if (!digit && !hex) {
            return false;
        }
    }
    return true;
}

// Directory containing the running executable (no trailing separator)
inline std::wstring GetModuleDirectory() {
    wchar_t path[MAX_PATH];
    DWORD len = GetModuleFileNameW(nullptr, path, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return L".";
    }

    std::wstring dir(path, len);
    size_t pos = dir.find_last_of(L"\\/");
    if (pos != std::wstring::npos) {
        dir = dir.substr(0, pos);
    }
    return dir;
}

} // namespace bitsagent
