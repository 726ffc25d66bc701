// BitsAgent v1.00 - BITS Transfer Service Binding Implementation

#include "bits_service.h"
#include "notification_adapter.h"
#include "../common/scoped_handle.h"
#include <bits2_5.h>
#include <bitsmsg.h>

using Microsoft::WRL::ComPtr;

namespace bitsagent {

namespace {

DWORD ThreadLanguage() {
    return static_cast<DWORD>(LANGIDFROMLCID(GetThreadLocale()));
}

uint64_t FileTimeTicks(const FILETIME& ft) {
    return (static_cast<uint64_t>(ft.dwHighDateTime) << 32) | ft.dwLowDateTime;
}

// Runs a getter that returns a CoTaskMemAlloc'd string and copies the result out
template <typename Getter>
HRESULT ReadTaskString(Getter getter, std::wstring& out) {
    LPWSTR raw = nullptr;
    HRESULT hr = getter(&raw);
    ScopedCoTaskString owned(raw);
    if (SUCCEEDED(hr)) {
        out = raw ? raw : L"";
    }
    return hr;
}

HRESULT ReadErrorDetail(IBackgroundCopyError* errorObj, JobError& error) {
    BG_ERROR_CONTEXT context = BG_ERROR_CONTEXT_NONE;
    HRESULT code = S_OK;
    HRESULT hr = errorObj->GetError(&context, &code);
    if (FAILED(hr)) return hr;

    error.context = static_cast<uint32_t>(context);
    error.error.hr = code;

    hr = ReadTaskString([errorObj](LPWSTR* text) {
        return errorObj->GetErrorContextDescription(ThreadLanguage(), text);
    }, error.contextDescription);
    if (FAILED(hr)) return hr;

    return ReadTaskString([errorObj](LPWSTR* text) {
        return errorObj->GetErrorDescription(ThreadLanguage(), text);
    }, error.error.message);
}

} // anonymous namespace

// ============================================================
// BitsTransferJob
// ============================================================

BitsTransferJob::BitsTransferJob(ComPtr<IBackgroundCopyJob> job)
    : job_(std::move(job)) {
}

HRESULT BitsTransferJob::GetId(JobId& id) {
    return job_->GetId(&id);
}

HRESULT BitsTransferJob::GetDisplayName(std::wstring& name) {
    return ReadTaskString([this](LPWSTR* text) {
        return job_->GetDisplayName(text);
    }, name);
}

HRESULT BitsTransferJob::AddFile(const std::wstring& remoteUrl, const std::wstring& localPath) {
    return job_->AddFile(remoteUrl.c_str(), localPath.c_str());
}

HRESULT BitsTransferJob::SetPriority(JobPriority priority) {
    return job_->SetPriority(priority == JobPriority::Foreground
        ? BG_JOB_PRIORITY_FOREGROUND
        : BG_JOB_PRIORITY_NORMAL);
}

HRESULT BitsTransferJob::SetProxyUsage(ProxyUsage usage) {
    BG_JOB_PROXY_USAGE bitsUsage = BG_JOB_PROXY_USAGE_PRECONFIG;
    switch (usage) {
        case ProxyUsage::Preconfig:  bitsUsage = BG_JOB_PROXY_USAGE_PRECONFIG; break;
        case ProxyUsage::NoProxy:    bitsUsage = BG_JOB_PROXY_USAGE_NO_PROXY; break;
        case ProxyUsage::AutoDetect: bitsUsage = BG_JOB_PROXY_USAGE_AUTODETECT; break;
    }
    return job_->SetProxySettings(bitsUsage, nullptr, nullptr);
}

HRESULT BitsTransferJob::SetMinimumRetryDelay(DWORD seconds) {
    return job_->SetMinimumRetryDelay(seconds);
}

HRESULT BitsTransferJob::SetRedirectReport() {
    ComPtr<IBackgroundCopyJobHttpOptions> options;
    HRESULT hr = job_.As(&options);
    if (FAILED(hr)) return hr;

    ULONG flags = 0;
    hr = options->GetSecurityFlags(&flags);
    if (FAILED(hr)) return hr;

    flags = (flags & ~BG_HTTP_REDIRECT_POLICY_MASK) | BG_HTTP_REDIRECT_POLICY_ALLOW_REPORT;
    return options->SetSecurityFlags(flags);
}

HRESULT BitsTransferJob::Suspend() {
    return job_->Suspend();
}

HRESULT BitsTransferJob::Resume() {
    return job_->Resume();
}

HRESULT BitsTransferJob::Complete() {
    return job_->Complete();
}

HRESULT BitsTransferJob::Cancel() {
    return job_->Cancel();
}

HRESULT BitsTransferJob::GetStatus(JobStatus& status) {
    BG_JOB_STATE state = BG_JOB_STATE_QUEUED;
    BG_JOB_PROGRESS progress = {};
    ULONG errorCount = 0;
    BG_JOB_TIMES times = {};

    HRESULT hr = job_->GetState(&state);
    if (FAILED(hr)) return hr;
    hr = job_->GetProgress(&progress);
    if (FAILED(hr)) return hr;
    hr = job_->GetErrorCount(&errorCount);
    if (FAILED(hr)) return hr;
    hr = job_->GetTimes(&times);
    if (FAILED(hr)) return hr;

    status.state = static_cast<JobState>(state);
    status.progress.totalBytes.reset();
    if (progress.BytesTotal != BG_SIZE_UNKNOWN) {
        status.progress.totalBytes = progress.BytesTotal;
    }
    status.progress.transferredBytes = progress.BytesTransferred;
    status.progress.totalFiles = progress.FilesTotal;
    status.progress.transferredFiles = progress.FilesTransferred;
    status.errorCount = errorCount;

    status.times.creation = FileTimeTicks(times.CreationTime);
    status.times.modification = FileTimeTicks(times.ModificationTime);
    status.times.transferCompletion.reset();
    uint64_t completion = FileTimeTicks(times.TransferCompletionTime);
    if (completion != 0) {
        status.times.transferCompletion = completion;
    }

    status.error.reset();
    ComPtr<IBackgroundCopyError> errorObj;
    hr = job_->GetError(&errorObj);
    if (hr == BG_E_ERROR_INFORMATION_UNAVAILABLE) {
        return S_OK;
    }
    if (FAILED(hr)) return hr;

    JobError error;
    hr = ReadErrorDetail(errorObj.Get(), error);
    if (FAILED(hr)) return hr;
    status.error = std::move(error);
    return S_OK;
}

HRESULT BitsTransferJob::GetFirstFileRemoteName(std::wstring& url) {
    ComPtr<IEnumBackgroundCopyFiles> files;
    HRESULT hr = job_->EnumFiles(&files);
    if (FAILED(hr)) return hr;

    ComPtr<IBackgroundCopyFile> file;
    hr = files->Next(1, &file, nullptr);
    if (FAILED(hr)) return hr;
    if (hr == S_FALSE || !file) {
        return BG_E_FILE_NOT_AVAILABLE;
    }

    return ReadTaskString([&file](LPWSTR* text) {
        return file->GetRemoteName(text);
    }, url);
}

HRESULT BitsTransferJob::RegisterNotifications(const JobNotificationHandlers& handlers) {
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(handlers);

    // The job takes its own reference; ours is dropped on return
    HRESULT hr = job_->SetNotifyInterface(adapter.Get());
    if (FAILED(hr)) return hr;

    return job_->SetNotifyFlags(NotificationAdapter::NotifyFlagsFor(handlers));
}

// ============================================================
// BitsTransferService
// ============================================================

BitsTransferService::BitsTransferService(ComPtr<IBackgroundCopyManager> manager)
    : manager_(std::move(manager)) {
}

HRESULT BitsTransferService::Connect(std::unique_ptr<TransferService>& service) {
    ComPtr<IBackgroundCopyManager> manager;
    HRESULT hr = CoCreateInstance(__uuidof(BackgroundCopyManager), nullptr, CLSCTX_LOCAL_SERVER,
                                  IID_PPV_ARGS(&manager));
    if (FAILED(hr)) {
        return hr;
    }
    service.reset(new BitsTransferService(std::move(manager)));
    return S_OK;
}

HRESULT BitsTransferService::CreateJob(const std::wstring& displayName,
                                       std::unique_ptr<TransferJob>& job) {
    GUID id = {};
    ComPtr<IBackgroundCopyJob> bitsJob;
    HRESULT hr = manager_->CreateJob(displayName.c_str(), BG_JOB_TYPE_DOWNLOAD, &id, &bitsJob);
    if (SUCCEEDED(hr)) {
        job.reset(new BitsTransferJob(std::move(bitsJob)));
    }
    return hr;
}

HRESULT BitsTransferService::GetJob(const JobId& id, std::unique_ptr<TransferJob>& job) {
    ComPtr<IBackgroundCopyJob> bitsJob;
    HRESULT hr = manager_->GetJob(id, &bitsJob);
    if (SUCCEEDED(hr)) {
        job.reset(new BitsTransferJob(std::move(bitsJob)));
    }
    return hr;
}

bool BitsTransferService::GetErrorDescription(HRESULT hr, std::wstring& description) {
    std::wstring text;
    HRESULT result = ReadTaskString([this, hr](LPWSTR* out) {
        return manager_->GetErrorDescription(hr, ThreadLanguage(), out);
    }, text);
    if (FAILED(result) || text.empty()) {
        return false;
    }
    description = std::move(text);
    // BITS descriptions end with a line break
    while (!description.empty() && (description.back() == L'\n' || description.back() == L'\r')) {
        description.pop_back();
    }
    return true;
}

} // namespace bitsagent
