#pragma once
// BitsAgent v1.00 - Command Protocol Types
// Closed command catalog exchanged between the control client and the worker.
// Every command names its own Success and Failure payloads.

#include "types.h"
#include "guid.h"
#include <cwchar>
#include <optional>
#include <string>
#include <variant>

namespace bitsagent {

enum class ProxyUsage : uint8_t {
    Preconfig = 0,   // use the system/IE proxy configuration
    NoProxy = 1,
    AutoDetect = 2
};

// Service status code with a human-readable description
struct HResultMessage {
    HRESULT hr = S_OK;
    std::wstring message;
};

// Where and how often the worker streams status snapshots
struct MonitorConfig {
    std::wstring pipeName;
    uint32_t intervalMillis = DEFAULT_MONITOR_INTERVAL_MS;
};

// ============================================================
// Job status snapshot
// ============================================================

// Values follow BG_JOB_STATE; undocumented values are carried through unchanged
enum class JobState : uint32_t {
    Queued = 0,
    Connecting = 1,
    Transferring = 2,
    Suspended = 3,
    Error = 4,
    TransientError = 5,
    Transferred = 6,
    Acknowledged = 7,
    Cancelled = 8
};

const wchar_t* JobStateName(JobState state);

// True once the job can make no further progress on its own
inline bool IsFinalJobState(JobState state) {
    return state == JobState::Error || state == JobState::Transferred ||
           state == JobState::Acknowledged || state == JobState::Cancelled;
}

struct JobProgress {
    std::optional<uint64_t> totalBytes;   // nullopt while the size is unknown
    uint64_t transferredBytes = 0;
    uint32_t totalFiles = 0;
    uint32_t transferredFiles = 0;
};

// FILETIME values as 100ns ticks since 1601
struct JobTimes {
    uint64_t creation = 0;
    uint64_t modification = 0;
    std::optional<uint64_t> transferCompletion;
};

struct JobError {
    uint32_t context = 0;              // BG_ERROR_CONTEXT
    std::wstring contextDescription;
    HResultMessage error;
};

struct JobStatus {
    JobState state = JobState::Queued;
    JobProgress progress;
    uint32_t errorCount = 0;
    std::optional<JobError> error;
    JobTimes times;
    std::optional<std::wstring> url;   // set only when the source URL changed since the last snapshot
};

// One-line summary: "Transferring 1024/4096 bytes, 0/1 files"
std::wstring DescribeStatus(const JobStatus& status);

// ============================================================
// Failures
// ============================================================

// Every kind enum ends with Other; the codec relies on it as the upper bound

enum class StartJobFailureKind : uint8_t {
    ArgumentValidation, Create, AddFile, ApplySettings, Resume, OtherBits, Other
};

enum class MonitorJobFailureKind : uint8_t {
    ArgumentValidation, NotFound, GetJob, OtherBits, Other
};

enum class SuspendJobFailureKind : uint8_t {
    NotFound, GetJob, SuspendJob, OtherBits, Other
};

enum class ResumeJobFailureKind : uint8_t {
    NotFound, GetJob, ResumeJob, OtherBits, Other
};

enum class SetJobPriorityFailureKind : uint8_t {
    NotFound, GetJob, ApplySettings, OtherBits, Other
};

enum class SetUpdateIntervalFailureKind : uint8_t {
    ArgumentValidation, NotFound, Other
};

enum class CompleteJobFailureKind : uint8_t {
    NotFound, GetJob, CompleteJob, PartialComplete, OtherBits, Other
};

enum class CancelJobFailureKind : uint8_t {
    NotFound, GetJob, CancelJob, OtherBits, Other
};

const wchar_t* FailureKindName(StartJobFailureKind kind);
const wchar_t* FailureKindName(MonitorJobFailureKind kind);
const wchar_t* FailureKindName(SuspendJobFailureKind kind);
const wchar_t* FailureKindName(ResumeJobFailureKind kind);
const wchar_t* FailureKindName(SetJobPriorityFailureKind kind);
const wchar_t* FailureKindName(SetUpdateIntervalFailureKind kind);
const wchar_t* FailureKindName(CompleteJobFailureKind kind);
const wchar_t* FailureKindName(CancelJobFailureKind kind);

// hresult is filled for kinds that wrap a service call; message for validation and Other
template <typename KindT>
struct CommandFailure {
    using Kind = KindT;

    Kind kind = Kind::Other;
    HResultMessage hresult;
    std::wstring message;

    static CommandFailure Of(Kind k) {
        CommandFailure f;
        f.kind = k;
        return f;
    }

    static CommandFailure WithHResult(Kind k, HResultMessage hr) {
        CommandFailure f;
        f.kind = k;
        f.hresult = std::move(hr);
        return f;
    }

    static CommandFailure WithMessage(Kind k, std::wstring text) {
        CommandFailure f;
        f.kind = k;
        f.message = std::move(text);
        return f;
    }

    std::wstring Describe() const {
        std::wstring text = FailureKindName(kind);
        if (FAILED(hresult.hr)) {
            wchar_t hex[16];
            swprintf_s(hex, L"0x%08X", static_cast<unsigned int>(hresult.hr));
            text += L" (" + std::wstring(hex) + L")";
        }
        if (!hresult.message.empty()) {
            text += L": " + hresult.message;
        }
        if (!message.empty()) {
            text += L": " + message;
        }
        return text;
    }
};

struct EmptySuccess {};

// ============================================================
// Commands
// ============================================================

enum class CommandTag : uint8_t {
    StartJob = 1,
    MonitorJob = 2,
    SuspendJob = 3,
    ResumeJob = 4,
    SetJobPriority = 5,
    SetUpdateInterval = 6,
    CompleteJob = 7,
    CancelJob = 8
};

struct StartJobSuccess {
    JobId guid{};
};

struct StartJobCommand {
    static constexpr CommandTag kTag = CommandTag::StartJob;
    using Success = StartJobSuccess;
    using Failure = CommandFailure<StartJobFailureKind>;

    std::wstring url;
    std::wstring savePath;
    ProxyUsage proxyUsage = ProxyUsage::Preconfig;
    std::optional<MonitorConfig> monitor;
};

struct MonitorJobCommand {
    static constexpr CommandTag kTag = CommandTag::MonitorJob;
    using Success = EmptySuccess;
    using Failure = CommandFailure<MonitorJobFailureKind>;

    JobId guid{};
    MonitorConfig monitor;
};

struct SuspendJobCommand {
    static constexpr CommandTag kTag = CommandTag::SuspendJob;
    using Success = EmptySuccess;
    using Failure = CommandFailure<SuspendJobFailureKind>;

    JobId guid{};
};

struct ResumeJobCommand {
    static constexpr CommandTag kTag = CommandTag::ResumeJob;
    using Success = EmptySuccess;
    using Failure = CommandFailure<ResumeJobFailureKind>;

    JobId guid{};
};

struct SetJobPriorityCommand {
    static constexpr CommandTag kTag = CommandTag::SetJobPriority;
    using Success = EmptySuccess;
    using Failure = CommandFailure<SetJobPriorityFailureKind>;

    JobId guid{};
    bool foreground = false;
};

struct SetUpdateIntervalCommand {
    static constexpr CommandTag kTag = CommandTag::SetUpdateInterval;
    using Success = EmptySuccess;
    using Failure = CommandFailure<SetUpdateIntervalFailureKind>;

    JobId guid{};
    uint32_t intervalMillis = DEFAULT_MONITOR_INTERVAL_MS;
};

struct CompleteJobCommand {
    static constexpr CommandTag kTag = CommandTag::CompleteJob;
    using Success = EmptySuccess;
    using Failure = CommandFailure<CompleteJobFailureKind>;

    JobId guid{};
};

struct CancelJobCommand {
    static constexpr CommandTag kTag = CommandTag::CancelJob;
    using Success = EmptySuccess;
    using Failure = CommandFailure<CancelJobFailureKind>;

    JobId guid{};
};

using Command = std::variant<
    StartJobCommand,
    MonitorJobCommand,
    SuspendJobCommand,
    ResumeJobCommand,
    SetJobPriorityCommand,
    SetUpdateIntervalCommand,
    CompleteJobCommand,
    CancelJobCommand>;

template <typename Cmd>
using CommandResult = std::variant<typename Cmd::Success, typename Cmd::Failure>;

} // namespace bitsagent
