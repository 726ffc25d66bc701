// BitsAgent - Configuration Manager Implementation
// INI-based configuration

#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cstring>
#include <optional>

namespace fs = std::filesystem;

namespace {
void StripUtf8Bom(std::string& content) {
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
    }
}

std::string AsciiLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return s;
}

bool ParseBool(const std::string& value) {
    std::string lower = AsciiLower(value);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::optional<DWORD> ParseUnsigned(const std::string& value) {
    if (value.empty() || value.size() > 10) {
        return std::nullopt;
    }
    uint64_t result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        result = result * 10 + static_cast<uint64_t>(c - '0');
    }
    if (result > MAXDWORD) {
        return std::nullopt;
    }
    return static_cast<DWORD>(result);
}

// Drive-rooted (C:\dir) or UNC (\\server\share) path
bool IsAbsoluteDirectory(const std::wstring& path) {
    if (path.size() >= 3 && iswalpha(path[0]) && path[1] == L':' &&
        (path[2] == L'\\' || path[2] == L'/')) {
        return true;
    }
    return path.size() >= 3 && path[0] == L'\\' && path[1] == L'\\';
}

std::wstring WithTrailingSeparator(const std::wstring& dir) {
    if (dir.empty() || dir.back() == L'\\' || dir.back() == L'/') {
        return dir;
    }
    return dir + L"\\";
}
} // anonymous namespace

namespace bitsagent {

AgentConfig& AgentConfig::Instance() {
    static AgentConfig instance;
    return instance;
}

AgentConfig::AgentConfig() {
    ResetDefaults();
}

void AgentConfig::ResetDefaults() {
    logLevel_ = LogLevel::LOG_INFO;
    logEnabled_ = true;
    jobName_ = DEFAULT_JOB_NAME;
    savePathPrefix_ = baseDir_.empty() ? std::wstring() : WithTrailingSeparator(baseDir_);
    minimumRetryDelay_ = DEFAULT_MINIMUM_RETRY_DELAY_SEC;
    monitorIntervalMs_ = DEFAULT_MONITOR_INTERVAL_MS;
    monitorWriteTimeoutMs_ = DEFAULT_MONITOR_WRITE_TIMEOUT_MS;
    localServiceOnly_ = false;
}

bool AgentConfig::Initialize(const std::wstring& baseDir) {
    CSLockGuard lock(cs_);

    baseDir_ = baseDir;
    configPath_ = baseDir + L"\\" + CONFIG_FILENAME;
    ResetDefaults();

    if (fs::exists(configPath_)) {
        return Reload();
    }

    LOG_INFO(L"Config: " + configPath_ + L" not found, writing defaults");
    return Save();
}

bool AgentConfig::Reload() {
    CSLockGuard lock(cs_);

    try {
        if (!fs::exists(configPath_)) {
            return false;
        }

        auto fsize = fs::file_size(configPath_);
        if (fsize > MAX_CONFIG_FILE_SIZE) {
            LOG_ERROR(L"Config: File too large (" + std::to_wstring(fsize) + L" bytes), max 1MB");
            return false;
        }

        std::ifstream file(configPath_, std::ios::binary);
        if (!file.is_open()) {
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string content = buffer.str();
        file.close();

        return ParseIni(content);
    }
    catch (const std::exception& e) {
        LOG_ERROR(std::string("Config: Load error - ") + e.what());
        return false;
    }
}

bool AgentConfig::Save() {
    CSLockGuard lock(cs_);

    try {
        std::string iniContent = SerializeIni();

        std::ofstream file(configPath_, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ALERT(L"Config: Unable to write " + configPath_);
            return false;
        }

        file << iniContent;
        file.close();
        return true;
    }
    catch (const std::exception& e) {
        LOG_ERROR(std::string("Config: Save error - ") + e.what());
        return false;
    }
}

bool AgentConfig::ParseIni(const std::string& contentIn) {
    try {
        std::string content = contentIn;
        StripUtf8Bom(content);

        ResetDefaults();

        std::istringstream stream(content);
        std::string line;
        std::string currentSection;

        while (std::getline(stream, line)) {
            // Trim whitespace
            size_t start = line.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) continue;
            size_t end = line.find_last_not_of(" \t\r\n");
            line = line.substr(start, end - start + 1);

            // Skip comments
            if (line[0] == ';' || line[0] == '#') {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                currentSection = AsciiLower(line.substr(1, line.size() - 2));

                if (currentSection != "logging" && currentSection != "jobs" &&
                    currentSection != "monitor" && currentSection != "pipe") {
                    LOG_ALERT(L"Config: Unknown section ignored: [" + Utf8ToWide(currentSection) + L"]");
                }
                continue;
            }

            // Key=Value pair
            size_t eqPos = line.find('=');
            if (eqPos == std::string::npos) continue;

            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            size_t keyEnd = key.find_last_not_of(" \t");
            if (keyEnd != std::string::npos) key = key.substr(0, keyEnd + 1);
            size_t valStart = value.find_first_not_of(" \t");
            value = (valStart != std::string::npos) ? value.substr(valStart) : std::string();

            std::string lowerKey = AsciiLower(key);

            if (currentSection == "logging") {
                ApplyLoggingKey(lowerKey, value);
            } else if (currentSection == "jobs") {
                ApplyJobsKey(lowerKey, value);
            } else if (currentSection == "monitor") {
                ApplyMonitorKey(lowerKey, value);
            } else if (currentSection == "pipe") {
                ApplyPipeKey(lowerKey, value);
            }
        }

        return true;
    }
    catch (const std::exception& e) {
        LOG_ERROR(std::string("Config: Parse error - ") + e.what());
        return false;
    }
}

void AgentConfig::ApplyLoggingKey(const std::string& lowerKey, const std::string& value) {
    if (lowerKey == "loglevel") {
        std::string upper = value;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(::toupper(c)); });

        if (upper == "ERROR") {
            logLevel_ = LogLevel::LOG_ERROR;
        } else if (upper == "ALERT") {
            logLevel_ = LogLevel::LOG_ALERT;
        } else if (upper == "INFO") {
            logLevel_ = LogLevel::LOG_INFO;
        } else if (upper == "DEBUG") {
            logLevel_ = LogLevel::LOG_DEBUG;
        } else {
            LOG_ALERT(L"Config: Invalid LogLevel ignored (using INFO): " + Utf8ToWide(value));
        }
    } else if (lowerKey == "logenabled") {
        logEnabled_ = ParseBool(value);
    } else {
        LOG_DEBUG(L"Config: Unknown key in [Logging]: " + Utf8ToWide(lowerKey));
    }
}

void AgentConfig::ApplyJobsKey(const std::string& lowerKey, const std::string& value) {
    if (lowerKey == "jobname") {
        if (value.empty()) {
            LOG_ALERT(L"Config: Empty JobName ignored");
            return;
        }
        jobName_ = Utf8ToWide(value);
    } else if (lowerKey == "savepathprefix") {
        std::wstring prefix = Utf8ToWide(value);
        if (!IsAbsoluteDirectory(prefix) || prefix.find(L"..") != std::wstring::npos) {
            LOG_ALERT(L"Config: SavePathPrefix must be an absolute directory, ignored: " + prefix);
            return;
        }
        savePathPrefix_ = WithTrailingSeparator(prefix);
    } else if (lowerKey == "minimumretrydelay") {
        auto parsed = ParseUnsigned(value);
        if (!parsed) {
            LOG_ALERT(L"Config: Invalid MinimumRetryDelay ignored: " + Utf8ToWide(value));
            return;
        }
        minimumRetryDelay_ = *parsed;
    } else {
        LOG_DEBUG(L"Config: Unknown key in [Jobs]: " + Utf8ToWide(lowerKey));
    }
}

void AgentConfig::ApplyMonitorKey(const std::string& lowerKey, const std::string& value) {
    if (lowerKey == "intervalms") {
        auto parsed = ParseUnsigned(value);
        if (!parsed || !IsValidUpdateInterval(*parsed)) {
            LOG_ALERT(L"Config: IntervalMs out of range, ignored: " + Utf8ToWide(value));
            return;
        }
        monitorIntervalMs_ = *parsed;
    } else if (lowerKey == "writetimeoutms") {
        auto parsed = ParseUnsigned(value);
        if (!parsed || *parsed == 0 || *parsed == INFINITE) {
            LOG_ALERT(L"Config: WriteTimeoutMs must be bounded, ignored: " + Utf8ToWide(value));
            return;
        }
        monitorWriteTimeoutMs_ = *parsed;
    } else {
        LOG_DEBUG(L"Config: Unknown key in [Monitor]: " + Utf8ToWide(lowerKey));
    }
}

void AgentConfig::ApplyPipeKey(const std::string& lowerKey, const std::string& value) {
    if (lowerKey == "localserviceonly") {
        localServiceOnly_ = ParseBool(value);
    } else {
        LOG_DEBUG(L"Config: Unknown key in [Pipe]: " + Utf8ToWide(lowerKey));
    }
}

std::string AgentConfig::SerializeIni() const {
    std::ostringstream oss;

    oss << "; BitsAgent Configuration\n";
    oss << "; Read once at startup by BitsAgent_Worker and BitsAgent_Client\n\n";

    oss << "[Logging]\n";
    oss << "; Log level: ERROR, ALERT, INFO, DEBUG\n";
    switch (logLevel_) {
        case LogLevel::LOG_ERROR: oss << "LogLevel=ERROR\n"; break;
        case LogLevel::LOG_ALERT: oss << "LogLevel=ALERT\n"; break;
        case LogLevel::LOG_INFO:  oss << "LogLevel=INFO\n";  break;
        case LogLevel::LOG_DEBUG: oss << "LogLevel=DEBUG\n"; break;
    }
    oss << "; Log output: 1=enabled, 0=disabled\n";
    oss << "LogEnabled=" << (logEnabled_ ? "1" : "0") << "\n";
    oss << "\n";

    oss << "[Jobs]\n";
    oss << "JobName=" << WideToUtf8(jobName_) << "\n";
    oss << "; Absolute directory that downloaded files are saved under\n";
    oss << "SavePathPrefix=" << WideToUtf8(savePathPrefix_) << "\n";
    oss << "; Seconds before a failed transfer is retried\n";
    oss << "MinimumRetryDelay=" << minimumRetryDelay_ << "\n";
    oss << "\n";

    oss << "[Monitor]\n";
    oss << "IntervalMs=" << monitorIntervalMs_ << "\n";
    oss << "WriteTimeoutMs=" << monitorWriteTimeoutMs_ << "\n";
    oss << "\n";

    oss << "[Pipe]\n";
    oss << "; 1 = only LocalService may connect to created pipes\n";
    oss << "LocalServiceOnly=" << (localServiceOnly_ ? "1" : "0") << "\n";

    return oss.str();
}

LogLevel AgentConfig::GetLogLevel() const {
    CSLockGuard lock(cs_);
    return logLevel_;
}

bool AgentConfig::IsLogEnabled() const {
    CSLockGuard lock(cs_);
    return logEnabled_;
}

std::wstring AgentConfig::GetJobName() const {
    CSLockGuard lock(cs_);
    return jobName_;
}

std::wstring AgentConfig::GetSavePathPrefix() const {
    CSLockGuard lock(cs_);
    return savePathPrefix_;
}

DWORD AgentConfig::GetMinimumRetryDelay() const {
    CSLockGuard lock(cs_);
    return minimumRetryDelay_;
}

DWORD AgentConfig::GetMonitorIntervalMs() const {
    CSLockGuard lock(cs_);
    return monitorIntervalMs_;
}

DWORD AgentConfig::GetMonitorWriteTimeoutMs() const {
    CSLockGuard lock(cs_);
    return monitorWriteTimeoutMs_;
}

bool AgentConfig::IsLocalServiceOnly() const {
    CSLockGuard lock(cs_);
    return localServiceOnly_;
}

void AgentConfig::SetLogEnabled(bool enabled) {
    CSLockGuard lock(cs_);
    logEnabled_ = enabled;
}

void AgentConfig::SetJobName(const std::wstring& name) {
    CSLockGuard lock(cs_);
    jobName_ = name;
}

void AgentConfig::SetSavePathPrefix(const std::wstring& prefix) {
    CSLockGuard lock(cs_);
    savePathPrefix_ = WithTrailingSeparator(prefix);
}

} // namespace bitsagent
