#pragma once
// BitsAgent Unit Tests - In-memory transfer service
// Jobs live in a shared backend so several service connections see the same state,
// the way they do with the real service. Every call can be made to fail.

#include "service/transfer_service.h"
#include <bitsmsg.h>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace fake {

using namespace bitsagent;

struct FakeJob {
    JobId id{};
    std::wstring displayName;
    std::wstring remoteUrl;
    std::wstring localPath;
    JobStatus status;
    JobPriority priority = JobPriority::Normal;
    ProxyUsage proxyUsage = ProxyUsage::Preconfig;
    DWORD minimumRetryDelay = 0;
    bool redirectReport = false;
    JobNotificationHandlers handlers;

    int foregroundCount = 0;
    int normalCount = 0;
    int suspendCount = 0;
    int resumeCount = 0;
    int completeCount = 0;
    int cancelCount = 0;
    int statusCount = 0;

    HRESULT addFileResult = S_OK;
    HRESULT setPriorityResult = S_OK;
    HRESULT settingsResult = S_OK;
    HRESULT suspendResult = S_OK;
    HRESULT resumeResult = S_OK;
    HRESULT completeResult = S_OK;
    HRESULT cancelResult = S_OK;
    HRESULT statusResult = S_OK;
    HRESULT registerResult = S_OK;
};

class FakeBackend : public std::enable_shared_from_this<FakeBackend> {
public:
    std::mutex mutex;
    std::map<JobId, std::shared_ptr<FakeJob>, GuidLess> jobs;

    HRESULT connectResult = S_OK;
    HRESULT createResult = S_OK;
    HRESULT getJobResult = S_OK;
    std::function<void(FakeJob&)> onCreate;     // adjusts each job CreateJob makes
    std::atomic<int> connectCount{0};

    // Job as if created earlier by some application
    std::shared_ptr<FakeJob> AddJob(const std::wstring& displayName,
                                    const std::wstring& remoteUrl = L"https://example/file") {
        std::lock_guard<std::mutex> lock(mutex);
        auto job = std::make_shared<FakeJob>();
        job->id.Data1 = ++lastId_;
        job->displayName = displayName;
        job->remoteUrl = remoteUrl;
        jobs[job->id] = job;
        return job;
    }

    std::shared_ptr<FakeJob> Find(const JobId& id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = jobs.find(id);
        return it == jobs.end() ? nullptr : it->second;
    }

    // Runs a registered handler the way the service would, from the caller's thread
    HRESULT FireTransferred(const JobId& id) { return Fire(id, &JobNotificationHandlers::transferred); }
    HRESULT FireError(const JobId& id) { return Fire(id, &JobNotificationHandlers::error); }

    void SetState(const JobId& id, JobState state) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = jobs.find(id);
        if (it != jobs.end()) {
            it->second->status.state = state;
        }
    }

    void SetUrl(const JobId& id, const std::wstring& url) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = jobs.find(id);
        if (it != jobs.end()) {
            it->second->remoteUrl = url;
        }
    }

    template <typename Fn>
    auto With(const JobId& id, Fn fn) {
        std::lock_guard<std::mutex> lock(mutex);
        return fn(*jobs.at(id));
    }

    TransferServiceFactory Factory();

private:
    HRESULT Fire(const JobId& id, std::function<HRESULT()> JobNotificationHandlers::*member) {
        std::function<HRESULT()> handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = jobs.find(id);
            if (it == jobs.end()) {
                return BG_E_NOT_FOUND;
            }
            handler = it->second->handlers.*member;
        }
        return handler ? handler() : S_FALSE;
    }

    unsigned long lastId_ = 0;
};

class FakeTransferJob : public TransferJob {
public:
    FakeTransferJob(std::shared_ptr<FakeBackend> backend, std::shared_ptr<FakeJob> job)
        : backend_(std::move(backend)), job_(std::move(job)) {}

    HRESULT GetId(JobId& id) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        id = job_->id;
        return S_OK;
    }

    HRESULT GetDisplayName(std::wstring& name) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        name = job_->displayName;
        return S_OK;
    }

    HRESULT AddFile(const std::wstring& remoteUrl, const std::wstring& localPath) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (FAILED(job_->addFileResult)) return job_->addFileResult;
        job_->remoteUrl = remoteUrl;
        job_->localPath = localPath;
        job_->status.progress.totalFiles = 1;
        return S_OK;
    }

    HRESULT SetPriority(JobPriority priority) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (FAILED(job_->setPriorityResult)) return job_->setPriorityResult;
        job_->priority = priority;
        if (priority == JobPriority::Foreground) {
            ++job_->foregroundCount;
        } else {
            ++job_->normalCount;
        }
        return S_OK;
    }

    HRESULT SetProxyUsage(ProxyUsage usage) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (FAILED(job_->settingsResult)) return job_->settingsResult;
        job_->proxyUsage = usage;
        return S_OK;
    }

    HRESULT SetMinimumRetryDelay(DWORD seconds) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        job_->minimumRetryDelay = seconds;
        return S_OK;
    }

    HRESULT SetRedirectReport() override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        job_->redirectReport = true;
        return S_OK;
    }

    HRESULT Suspend() override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        ++job_->suspendCount;
        if (FAILED(job_->suspendResult)) return job_->suspendResult;
        job_->status.state = JobState::Suspended;
        return S_OK;
    }

    HRESULT Resume() override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        ++job_->resumeCount;
        if (FAILED(job_->resumeResult)) return job_->resumeResult;
        job_->status.state = JobState::Queued;
        return S_OK;
    }

    HRESULT Complete() override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        ++job_->completeCount;
        if (SUCCEEDED(job_->completeResult)) {
            job_->status.state = JobState::Acknowledged;
        }
        return job_->completeResult;
    }

    HRESULT Cancel() override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        ++job_->cancelCount;
        if (SUCCEEDED(job_->cancelResult)) {
            job_->status.state = JobState::Cancelled;
        }
        return job_->cancelResult;
    }

    HRESULT GetStatus(JobStatus& status) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        ++job_->statusCount;
        if (FAILED(job_->statusResult)) return job_->statusResult;
        status = job_->status;
        status.url.reset();
        return S_OK;
    }

    HRESULT GetFirstFileRemoteName(std::wstring& url) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (job_->remoteUrl.empty()) return BG_E_FILE_NOT_AVAILABLE;
        url = job_->remoteUrl;
        return S_OK;
    }

    HRESULT RegisterNotifications(const JobNotificationHandlers& handlers) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (FAILED(job_->registerResult)) return job_->registerResult;
        job_->handlers = handlers;
        return S_OK;
    }

private:
    std::shared_ptr<FakeBackend> backend_;
    std::shared_ptr<FakeJob> job_;
};

class FakeService : public TransferService {
public:
    explicit FakeService(std::shared_ptr<FakeBackend> backend) : backend_(std::move(backend)) {}

    HRESULT CreateJob(const std::wstring& displayName, std::unique_ptr<TransferJob>& job) override {
        if (FAILED(backend_->createResult)) return backend_->createResult;
        std::shared_ptr<FakeJob> record = backend_->AddJob(displayName, L"");
        if (backend_->onCreate) {
            std::lock_guard<std::mutex> lock(backend_->mutex);
            backend_->onCreate(*record);
        }
        job.reset(new FakeTransferJob(backend_, record));
        return S_OK;
    }

    HRESULT GetJob(const JobId& id, std::unique_ptr<TransferJob>& job) override {
        if (FAILED(backend_->getJobResult)) return backend_->getJobResult;
        std::shared_ptr<FakeJob> record = backend_->Find(id);
        if (!record) return BG_E_NOT_FOUND;
        job.reset(new FakeTransferJob(backend_, record));
        return S_OK;
    }

    bool GetErrorDescription(HRESULT hr, std::wstring& description) override {
        if (hr == BG_E_NOT_FOUND) {
            description = L"The requested job was not found.";
            return true;
        }
        return false;
    }

private:
    std::shared_ptr<FakeBackend> backend_;
};

inline TransferServiceFactory FakeBackend::Factory() {
    std::shared_ptr<FakeBackend> self = shared_from_this();
    return [self](std::unique_ptr<TransferService>& service) -> HRESULT {
        ++self->connectCount;
        if (FAILED(self->connectResult)) return self->connectResult;
        service.reset(new FakeService(self));
        return S_OK;
    };
}

} // namespace fake
