// BitsAgent - Lightweight Logger Implementation
// Levels are written as 4-char fixed width tags (ERR /ALRT/INFO/DEBG)

#include "logger.h"
#include <cstdio>
#include <ctime>
#include <iostream>

namespace bitsagent {

LightweightLogger& LightweightLogger::Instance() {
    static LightweightLogger instance;
    return instance;
}

LightweightLogger::LightweightLogger()
    : initialized_(false)
    , consoleOutput_(false)
    , currentLevel_(LogLevel::LOG_INFO)
    , enabled_(true) {
}

LightweightLogger::~LightweightLogger() {
    Shutdown();
}

bool LightweightLogger::Initialize(const std::wstring& baseDir, const std::wstring& logFileName) {
    CSLockGuard lock(cs_);

    if (initialized_) {
        return true;
    }

    logPath_ = baseDir + L"\\" + logFileName;
    backupPath_ = logPath_ + L".1";

    fileHandle_ = MakeScopedHandle(CreateFileW(
        logPath_.c_str(),
        FILE_APPEND_DATA,
        FILE_SHARE_READ | FILE_SHARE_WRITE,
        nullptr,
        OPEN_ALWAYS,
        FILE_ATTRIBUTE_NORMAL,
        nullptr
    ));

    if (!fileHandle_) {
        return false;
    }

    initialized_ = true;
    return true;
}

void LightweightLogger::Shutdown() {
    CSLockGuard lock(cs_);
    fileHandle_.reset();
    initialized_ = false;
}

void LightweightLogger::SetConsoleOutput(bool enabled) {
    CSLockGuard lock(cs_);
    consoleOutput_ = enabled;
}

void LightweightLogger::SetLogLevel(LogLevel level) {
    currentLevel_.store(level, std::memory_order_release);
}

std::wstring LightweightLogger::FormatLine(const std::wstring& timestamp, const wchar_t* levelStr,
                                           DWORD threadId, const std::wstring& message) {
    return L"[" + timestamp + L"] [" + levelStr + L"] [" +
           std::to_wstring(threadId) + L"] " + message;
}

void LightweightLogger::Log(LogLevel level, const wchar_t* levelStr, const std::wstring& message) {
    if (!enabled_.load(std::memory_order_acquire)) return;
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(GetLogLevel())) return;

    WriteMessage(FormatLine(GetTimestamp(), levelStr, GetCurrentThreadId(), message));
}

void LightweightLogger::Error(const std::wstring& message) {
    Log(LogLevel::LOG_ERROR, L"ERR ", message);
}

void LightweightLogger::Error(const std::string& message) {
    Error(Utf8ToWide(message));
}

void LightweightLogger::Alert(const std::wstring& message) {
    Log(LogLevel::LOG_ALERT, L"ALRT", message);
}

void LightweightLogger::Alert(const std::string& message) {
    Alert(Utf8ToWide(message));
}

void LightweightLogger::Info(const std::wstring& message) {
    Log(LogLevel::LOG_INFO, L"INFO", message);
}

void LightweightLogger::Info(const std::string& message) {
    Info(Utf8ToWide(message));
}

void LightweightLogger::Debug(const std::wstring& message) {
    Log(LogLevel::LOG_DEBUG, L"DEBG", message);
}

void LightweightLogger::Debug(const std::string& message) {
    Debug(Utf8ToWide(message));
}

void LightweightLogger::WriteMessage(const std::wstring& formattedMessage) {
    CSLockGuard lock(cs_);

    if (consoleOutput_) {
        std::wcerr << formattedMessage << std::endl;
    }

    if (!initialized_ || !fileHandle_) return;

    // Check rotation before writing
    CheckRotation();
    if (!fileHandle_) return;

    std::string utf8Msg = WideToUtf8(formattedMessage);
    utf8Msg += "\r\n";

    DWORD bytesWritten = 0;
    WriteFile(fileHandle_.get(), utf8Msg.c_str(),
              static_cast<DWORD>(utf8Msg.size()), &bytesWritten, nullptr);
    FlushFileBuffers(fileHandle_.get());
}

// Called with cs_ held
void LightweightLogger::CheckRotation() {
    LARGE_INTEGER fileSize;
    if (!GetFileSizeEx(fileHandle_.get(), &fileSize)) {
        return;
    }

    if (static_cast<size_t>(fileSize.QuadPart) < MAX_LOG_SIZE) {
        return;
    }

    fileHandle_.reset();

    bool deleteFailed = !DeleteFileW(backupPath_.c_str())
                        && GetLastError() != ERROR_FILE_NOT_FOUND;
    bool moveFailed = !MoveFileW(logPath_.c_str(), backupPath_.c_str());

    fileHandle_ = MakeScopedHandle(CreateFileW(
        logPath_.c_str(),
        FILE_APPEND_DATA,
        FILE_SHARE_READ | FILE_SHARE_WRITE,
        nullptr,
        moveFailed ? OPEN_ALWAYS : CREATE_ALWAYS,
        FILE_ATTRIBUTE_NORMAL,
        nullptr
    ));

    if (fileHandle_ && (deleteFailed || moveFailed)) {
        std::wstring reason = deleteFailed ? L"backup delete failed" : L"log rename failed";
        std::string note = WideToUtf8(FormatLine(GetTimestamp(), L"DEBG", GetCurrentThreadId(),
                                                 L"Logger: Rotation - " + reason)) + "\r\n";
        DWORD bytesWritten = 0;
        WriteFile(fileHandle_.get(), note.c_str(),
                  static_cast<DWORD>(note.size()), &bytesWritten, nullptr);
    }
}

std::wstring LightweightLogger::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_s(&tm_buf, &time);

    wchar_t buffer[32];
    wcsftime(buffer, 32, L"%Y/%m/%d %H:%M:%S", &tm_buf);
    return std::wstring(buffer);
}

void LightweightLogger::SetEnabled(bool enabled) {
    enabled_.store(enabled, std::memory_order_release);
}

bool LightweightLogger::IsEnabled() const {
    return enabled_.load(std::memory_order_acquire);
}

} // namespace bitsagent
