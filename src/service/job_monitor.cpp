// BitsAgent v1.00 - Job Monitor Implementation

#include "job_monitor.h"
#include "../common/logger.h"
#include "../common/overlapped.h"

namespace bitsagent {

// ============================================================
// MonitorControl
// ============================================================

bool MonitorControl::SetInterval(DWORD intervalMs) {
    std::shared_ptr<MonitorState> state = state_.lock();
    if (!state) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->intervalMs = intervalMs;
    }
    state->changed.notify_all();
    return true;
}

bool MonitorControl::Stop() {
    std::shared_ptr<MonitorState> state = state_.lock();
    if (!state) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->shutdown = true;
    }
    state->changed.notify_all();
    return true;
}

bool MonitorControl::Supersede() {
    std::shared_ptr<MonitorState> state = state_.lock();
    if (!state) {
        return false;
    }
    {
        std::lock_guard<std::mutex> priorityLock(state->priorityMutex);
        std::lock_guard<std::mutex> lock(state->mutex);
        state->keepPriority = true;
        state->shutdown = true;
    }
    state->changed.notify_all();
    return true;
}

std::wstring MonitorResult::Describe() const {
    switch (kind) {
        case MonitorResultKind::Ok:
            return L"ok";
        case MonitorResultKind::NotConnected:
            return L"monitor not connected";
        case MonitorResultKind::Timeout:
            return L"monitor timed out";
        case MonitorResultKind::Failed: {
            wchar_t hex[16];
            swprintf_s(hex, L"0x%08X", static_cast<unsigned int>(hr));
            return L"status fetch failed (" + std::wstring(hex) + L")";
        }
    }
    return L"unknown monitor result";
}

// ============================================================
// JobMonitor
// ============================================================

namespace {

std::function<HRESULT()> MakeWakeHandler(std::weak_ptr<MonitorState> weak) {
    return [weak]() -> HRESULT {
        std::shared_ptr<MonitorState> state = weak.lock();
        if (!state) {
            return E_FAIL;
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->notified = true;
        }
        state->changed.notify_all();
        return S_OK;
    };
}

} // anonymous namespace

JobMonitor::JobMonitor(TransferServiceFactory factory, const JobId& id, DWORD intervalMs)
    : factory_(std::move(factory))
    , id_(id)
    , state_(std::make_shared<MonitorState>())
    , priorityRestored_(false) {
    state_->intervalMs = intervalMs;
}

JobMonitor::~JobMonitor() {
    Stop();
}

HRESULT JobMonitor::Create(TransferServiceFactory factory, TransferJob& job, const JobId& id,
                           DWORD intervalMs, std::unique_ptr<JobMonitor>& monitor) {
    std::unique_ptr<JobMonitor> created(new JobMonitor(std::move(factory), id, intervalMs));

    HRESULT hr = job.SetPriority(JobPriority::Foreground);
    if (FAILED(hr)) {
        // Never raised, nothing to restore
        created->priorityRestored_ = true;
        return hr;
    }

    JobNotificationHandlers handlers;
    handlers.transferred = MakeWakeHandler(created->state_);
    handlers.error = MakeWakeHandler(created->state_);
    hr = job.RegisterNotifications(handlers);
    if (FAILED(hr)) {
        return hr;
    }

    LOG_DEBUG(L"Monitor: Created for " + FormatGuid(id) +
              L" (interval " + std::to_wstring(intervalMs) + L"ms)");
    monitor = std::move(created);
    return S_OK;
}

void JobMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->shutdown = true;
    }
    state_->changed.notify_all();
    RestorePriority();
}

MonitorResult JobMonitor::ShutDown(MonitorResultKind kind, HRESULT hr) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->shutdown = true;
    }
    RestorePriority();
    return MonitorResult::Make(kind, hr);
}

MonitorResult JobMonitor::GetStatus(DWORD timeoutMs, JobStatus& status) {
    const Clock::time_point started = Clock::now();
    const bool hasDeadline = (timeoutMs != INFINITE);
    const Clock::time_point deadline = started + std::chrono::milliseconds(timeoutMs);

    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        for (;;) {
            if (state_->shutdown) {
                lock.unlock();
                RestorePriority();
                return MonitorResult::Make(MonitorResultKind::NotConnected);
            }

            Clock::time_point now = Clock::now();
            if (hasDeadline && now > deadline) {
                lock.unlock();
                return ShutDown(MonitorResultKind::Timeout);
            }

            // Read every pass so a new interval applies to the current wait
            std::chrono::milliseconds interval(state_->intervalMs);

            if (state_->notified || !lastStatus_) {
                break;
            }
            Clock::time_point wake = *lastStatus_ + interval;
            if (hasDeadline && deadline < wake) {
                wake = deadline;
            }
            if (wake <= now) {
                break;
            }

            state_->changed.wait_until(lock, wake);
        }
        state_->notified = false;
    }

    lastStatus_ = Clock::now();

    HRESULT hr = FetchStatus(status);
    if (FAILED(hr)) {
        LOG_ALERT(L"Monitor: Status fetch failed for " + FormatGuid(id_) + L" - " +
                  FormatSystemMessage(static_cast<DWORD>(hr)));
        return ShutDown(MonitorResultKind::Failed, hr);
    }
    return MonitorResult::Ok();
}

HRESULT JobMonitor::FetchStatus(JobStatus& status) {
    std::unique_ptr<TransferService> service;
    HRESULT hr = factory_(service);
    if (FAILED(hr)) return hr;

    std::unique_ptr<TransferJob> job;
    hr = service->GetJob(id_, job);
    if (FAILED(hr)) return hr;

    JobStatus snapshot;
    hr = job->GetStatus(snapshot);
    if (FAILED(hr)) return hr;

    std::wstring url;
    hr = job->GetFirstFileRemoteName(url);
    if (FAILED(hr)) return hr;

    if (lastUrl_ && *lastUrl_ == url) {
        snapshot.url.reset();
    } else {
        lastUrl_ = url;
        snapshot.url = std::move(url);
    }

    status = std::move(snapshot);
    return S_OK;
}

void JobMonitor::RestorePriority() {
    if (priorityRestored_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> priorityLock(state_->priorityMutex);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->keepPriority) {
            return;
        }
    }

    std::unique_ptr<TransferService> service;
    std::unique_ptr<TransferJob> job;
    HRESULT hr = factory_(service);
    if (SUCCEEDED(hr)) {
        hr = service->GetJob(id_, job);
    }
    if (SUCCEEDED(hr)) {
        hr = job->SetPriority(JobPriority::Normal);
    }

    // Completed and cancelled jobs reject the call; that is expected
    if (FAILED(hr)) {
        LOG_DEBUG(L"Monitor: Priority not restored for " + FormatGuid(id_) + L" - " +
                  FormatSystemMessage(static_cast<DWORD>(hr)));
    } else {
        LOG_DEBUG(L"Monitor: Priority restored for " + FormatGuid(id_));
    }
}

} // namespace bitsagent
