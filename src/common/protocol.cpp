// BitsAgent v1.00 - Command Protocol Names

#include "protocol.h"

namespace bitsagent {

const wchar_t* JobStateName(JobState state) {
    switch (state) {
        case JobState::Queued:         return L"Queued";
        case JobState::Connecting:     return L"Connecting";
        case JobState::Transferring:   return L"Transferring";
        case JobState::Suspended:      return L"Suspended";
        case JobState::Error:          return L"Error";
        case JobState::TransientError: return L"TransientError";
        case JobState::Transferred:    return L"Transferred";
        case JobState::Acknowledged:   return L"Acknowledged";
        case JobState::Cancelled:      return L"Cancelled";
    }
    return L"Other";
}

std::wstring DescribeStatus(const JobStatus& status) {
    std::wstring text = JobStateName(status.state);
    text += L" " + std::to_wstring(status.progress.transferredBytes) + L"/";
    text += status.progress.totalBytes ? std::to_wstring(*status.progress.totalBytes) : L"?";
    text += L" bytes, " + std::to_wstring(status.progress.transferredFiles) + L"/" +
            std::to_wstring(status.progress.totalFiles) + L" files";
    if (status.error) {
        wchar_t hex[16];
        swprintf_s(hex, L"0x%08X", static_cast<unsigned int>(status.error->error.hr));
        text += L", error " + std::wstring(hex);
        if (!status.error->error.message.empty()) {
            text += L" " + status.error->error.message;
        }
    }
    if (status.url) {
        text += L", url " + *status.url;
    }
    return text;
}

const wchar_t* FailureKindName(StartJobFailureKind kind) {
    switch (kind) {
        case StartJobFailureKind::ArgumentValidation: return L"ArgumentValidation";
        case StartJobFailureKind::Create:             return L"Create";
        case StartJobFailureKind::AddFile:            return L"AddFile";
        case StartJobFailureKind::ApplySettings:      return L"ApplySettings";
        case StartJobFailureKind::Resume:             return L"Resume";
        case StartJobFailureKind::OtherBits:          return L"OtherBITS";
        case StartJobFailureKind::Other:              return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(MonitorJobFailureKind kind) {
    switch (kind) {
        case MonitorJobFailureKind::ArgumentValidation: return L"ArgumentValidation";
        case MonitorJobFailureKind::NotFound:           return L"NotFound";
        case MonitorJobFailureKind::GetJob:             return L"GetJob";
        case MonitorJobFailureKind::OtherBits:          return L"OtherBITS";
        case MonitorJobFailureKind::Other:              return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(SuspendJobFailureKind kind) {
    switch (kind) {
        case SuspendJobFailureKind::NotFound:   return L"NotFound";
        case SuspendJobFailureKind::GetJob:     return L"GetJob";
        case SuspendJobFailureKind::SuspendJob: return L"SuspendJob";
        case SuspendJobFailureKind::OtherBits:  return L"OtherBITS";
        case SuspendJobFailureKind::Other:      return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(ResumeJobFailureKind kind) {
    switch (kind) {
        case ResumeJobFailureKind::NotFound:  return L"NotFound";
        case ResumeJobFailureKind::GetJob:    return L"GetJob";
        case ResumeJobFailureKind::ResumeJob: return L"ResumeJob";
        case ResumeJobFailureKind::OtherBits: return L"OtherBITS";
        case ResumeJobFailureKind::Other:     return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(SetJobPriorityFailureKind kind) {
    switch (kind) {
        case SetJobPriorityFailureKind::NotFound:      return L"NotFound";
        case SetJobPriorityFailureKind::GetJob:        return L"GetJob";
        case SetJobPriorityFailureKind::ApplySettings: return L"ApplySettings";
        case SetJobPriorityFailureKind::OtherBits:     return L"OtherBITS";
        case SetJobPriorityFailureKind::Other:         return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(SetUpdateIntervalFailureKind kind) {
    switch (kind) {
        case SetUpdateIntervalFailureKind::ArgumentValidation: return L"ArgumentValidation";
        case SetUpdateIntervalFailureKind::NotFound:           return L"NotFound";
        case SetUpdateIntervalFailureKind::Other:              return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(CompleteJobFailureKind kind) {
    switch (kind) {
        case CompleteJobFailureKind::NotFound:        return L"NotFound";
        case CompleteJobFailureKind::GetJob:          return L"GetJob";
        case CompleteJobFailureKind::CompleteJob:     return L"CompleteJob";
        case CompleteJobFailureKind::PartialComplete: return L"PartialComplete";
        case CompleteJobFailureKind::OtherBits:       return L"OtherBITS";
        case CompleteJobFailureKind::Other:           return L"Other";
    }
    return L"Unknown";
}

const wchar_t* FailureKindName(CancelJobFailureKind kind) {
    switch (kind) {
        case CancelJobFailureKind::NotFound:  return L"NotFound";
        case CancelJobFailureKind::GetJob:    return L"GetJob";
        case CancelJobFailureKind::CancelJob: return L"CancelJob";
        case CancelJobFailureKind::OtherBits: return L"OtherBITS";
        case CancelJobFailureKind::Other:     return L"Other";
    }
    return L"Unknown";
}

} // namespace bitsagent
