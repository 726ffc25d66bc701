#pragma once
// BitsAgent - Lightweight Logger
// Thread-safe rotating file logger with 100KB limit

#include "types.h"
#include "scoped_handle.h"
#include <string>
#include <chrono>

namespace bitsagent {

class LightweightLogger {
public:
    // Singleton access
    static LightweightLogger& Instance();

    // Open <baseDir>\<logFileName>; backup goes to <logFileName>.1
    bool Initialize(const std::wstring& baseDir, const std::wstring& logFileName);

    // Shutdown logger
    void Shutdown();

    void Error(const std::wstring& message);
    void Error(const std::string& message);
    void Alert(const std::wstring& message);
    void Alert(const std::string& message);
    void Info(const std::wstring& message);
    void Info(const std::string& message);
    void Debug(const std::wstring& message);
    void Debug(const std::string& message);

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const { return currentLevel_.load(std::memory_order_acquire); }

    void SetEnabled(bool enabled);
    bool IsEnabled() const;

    // Mirror log lines to stderr (console tools and debug runs)
    void SetConsoleOutput(bool enabled);

    // Exposed for tests: "[YYYY/MM/DD HH:MM:SS] [LEVL] [tid] message"
    static std::wstring FormatLine(const std::wstring& timestamp, const wchar_t* levelStr,
                                   DWORD threadId, const std::wstring& message);

private:
    LightweightLogger();
    ~LightweightLogger();
    LightweightLogger(const LightweightLogger&) = delete;
    LightweightLogger& operator=(const LightweightLogger&) = delete;

    // Write message to file with rotation check
    void WriteMessage(const std::wstring& formattedMessage);

    // Check and perform log rotation
    void CheckRotation();

    std::wstring GetTimestamp() const;

    void Log(LogLevel level, const wchar_t* levelStr, const std::wstring& message);

    std::wstring logPath_;
    std::wstring backupPath_;
    ScopedHandle fileHandle_;
    CriticalSection cs_;
    bool initialized_;
    bool consoleOutput_;
    std::atomic<LogLevel> currentLevel_;
    std::atomic<bool> enabled_;
};

#define LOG_ERROR(msg) bitsagent::LightweightLogger::Instance().Error(msg)
#define LOG_ALERT(msg) bitsagent::LightweightLogger::Instance().Alert(msg)
#define LOG_INFO(msg)  bitsagent::LightweightLogger::Instance().Info(msg)
#define LOG_DEBUG(msg) bitsagent::LightweightLogger::Instance().Debug(msg)

} // namespace bitsagent
