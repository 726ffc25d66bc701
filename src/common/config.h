#pragma once
// BitsAgent - Configuration Manager
// INI-based configuration stored next to the executable

#include "types.h"
#include "scoped_handle.h"
#include <string>

class ConfigParserTest;

namespace bitsagent {

class AgentConfig {
public:
    // Singleton access
    static AgentConfig& Instance();

    // Load <baseDir>\BitsAgent.ini, writing a default file if none exists
    bool Initialize(const std::wstring& baseDir);

    // Reload configuration from file
    bool Reload();

    // Save current configuration to file
    bool Save();

    LogLevel GetLogLevel() const;
    bool IsLogEnabled() const;

    // Display name given to created jobs; only jobs carrying it are controllable
    std::wstring GetJobName() const;
    // Absolute directory (with trailing separator) that save paths are joined to
    std::wstring GetSavePathPrefix() const;
    DWORD GetMinimumRetryDelay() const;
    DWORD GetMonitorIntervalMs() const;
    DWORD GetMonitorWriteTimeoutMs() const;
    bool IsLocalServiceOnly() const;

    void SetLogEnabled(bool enabled);
    void SetJobName(const std::wstring& name);
    void SetSavePathPrefix(const std::wstring& prefix);

private:
    friend class ::ConfigParserTest;

    AgentConfig();
    ~AgentConfig() = default;
    AgentConfig(const AgentConfig&) = delete;
    AgentConfig& operator=(const AgentConfig&) = delete;

    // Restore every value to its default
    void ResetDefaults();

    // Parse INI content
    bool ParseIni(const std::string& content);

    // Serialize to INI
    std::string SerializeIni() const;

    void ApplyLoggingKey(const std::string& lowerKey, const std::string& value);
    void ApplyJobsKey(const std::string& lowerKey, const std::string& value);
    void ApplyMonitorKey(const std::string& lowerKey, const std::string& value);
    void ApplyPipeKey(const std::string& lowerKey, const std::string& value);

    std::wstring configPath_;
    std::wstring baseDir_;
    LogLevel logLevel_;
    bool logEnabled_;
    std::wstring jobName_;
    std::wstring savePathPrefix_;
    DWORD minimumRetryDelay_;
    DWORD monitorIntervalMs_;
    DWORD monitorWriteTimeoutMs_;
    bool localServiceOnly_;

    mutable CriticalSection cs_;
};

} // namespace bitsagent
