// BitsAgent v1.00 - Job Controller Implementation

#include "job_controller.h"
#include "../common/logger.h"
#include "../common/overlapped.h"
#include <bitsmsg.h>

namespace bitsagent {

HResultMessage DescribeHResult(TransferService* service, HRESULT hr) {
    HResultMessage result;
    result.hr = hr;
    if (!service || !service->GetErrorDescription(hr, result.message)) {
        result.message = FormatSystemMessage(static_cast<DWORD>(hr));
    }
    return result;
}

namespace {

bool ValidateMonitorConfig(const MonitorConfig& config, std::wstring& problem) {
    if (!IsValidPipeName(config.pipeName)) {
        problem = L"invalid monitor pipe name";
        return false;
    }
    if (!IsValidUpdateInterval(config.intervalMillis)) {
        problem = L"monitor interval out of range";
        return false;
    }
    return true;
}

// Tear down a job that could not be fully started
void CancelHalfBuiltJob(TransferJob& job, const JobId& id) {
    HRESULT hr = job.Cancel();
    if (FAILED(hr)) {
        LOG_ALERT(L"Job: Could not cancel partially started job " + FormatGuid(id) + L" - " +
                  FormatSystemMessage(static_cast<DWORD>(hr)));
    }
}

} // anonymous namespace

JobController::JobController(TransferServiceFactory factory, JobControllerSettings settings)
    : factory_(std::move(factory))
    , settings_(std::move(settings)) {
}

JobController::~JobController() {
    StopAllMonitors();
}

template <typename Failure>
bool JobController::OpenOwnedJob(const JobId& id, std::unique_ptr<TransferService>& service,
                                 std::unique_ptr<TransferJob>& job, Failure& failure) {
    using Kind = typename Failure::Kind;

    HRESULT hr = factory_(service);
    if (FAILED(hr)) {
        failure = Failure::WithHResult(Kind::Other, DescribeHResult(nullptr, hr));
        failure.message = L"connecting to the transfer service";
        return false;
    }

    hr = service->GetJob(id, job);
    if (hr == BG_E_NOT_FOUND) {
        failure = Failure::Of(Kind::NotFound);
        return false;
    }
    if (FAILED(hr)) {
        failure = Failure::WithHResult(Kind::GetJob, DescribeHResult(service.get(), hr));
        return false;
    }

    std::wstring name;
    hr = job->GetDisplayName(name);
    if (FAILED(hr)) {
        failure = Failure::WithHResult(Kind::GetJob, DescribeHResult(service.get(), hr));
        return false;
    }
    if (name != settings_.jobName) {
        // Another application's job is treated as unknown
        LOG_DEBUG(L"Job: " + FormatGuid(id) + L" has foreign name '" + name + L"'");
        failure = Failure::Of(Kind::NotFound);
        return false;
    }
    return true;
}

template <typename Cmd, typename Action>
CommandResult<Cmd> JobController::RunJobAction(const JobId& id,
                                               typename Cmd::Failure::Kind actionKind,
                                               const wchar_t* actionName, Action action) {
    using Failure = typename Cmd::Failure;

    std::unique_ptr<TransferService> service;
    std::unique_ptr<TransferJob> job;
    Failure failure;
    if (!OpenOwnedJob(id, service, job, failure)) {
        return failure;
    }

    HRESULT hr = action(*job);
    if (FAILED(hr)) {
        LOG_ALERT(std::wstring(L"Job: ") + actionName + L" failed for " + FormatGuid(id));
        return Failure::WithHResult(actionKind, DescribeHResult(service.get(), hr));
    }

    LOG_INFO(std::wstring(L"Job: ") + actionName + L" " + FormatGuid(id));
    return typename Cmd::Success();
}

// ============================================================
// Commands
// ============================================================

CommandResult<StartJobCommand> JobController::StartJob(const StartJobCommand& cmd,
                                                       std::unique_ptr<JobMonitor>& monitor) {
    using Failure = StartJobCommand::Failure;
    using Kind = StartJobFailureKind;

    if (!IsValidUrl(cmd.url)) {
        return Failure::WithMessage(Kind::ArgumentValidation, L"invalid url");
    }
    if (!IsValidSavePath(cmd.savePath)) {
        return Failure::WithMessage(Kind::ArgumentValidation, L"invalid save path");
    }
    std::wstring problem;
    if (cmd.monitor && !ValidateMonitorConfig(*cmd.monitor, problem)) {
        return Failure::WithMessage(Kind::ArgumentValidation, problem);
    }

    std::unique_ptr<TransferService> service;
    HRESULT hr = factory_(service);
    if (FAILED(hr)) {
        Failure failure = Failure::WithHResult(Kind::Other, DescribeHResult(nullptr, hr));
        failure.message = L"connecting to the transfer service";
        return failure;
    }

    std::unique_ptr<TransferJob> job;
    hr = service->CreateJob(settings_.jobName, job);
    if (FAILED(hr)) {
        return Failure::WithHResult(Kind::Create, DescribeHResult(service.get(), hr));
    }

    JobId id{};
    hr = job->GetId(id);
    if (FAILED(hr)) {
        CancelHalfBuiltJob(*job, id);
        return Failure::WithHResult(Kind::OtherBits, DescribeHResult(service.get(), hr));
    }

    hr = job->SetProxyUsage(cmd.proxyUsage);
    if (SUCCEEDED(hr)) {
        hr = job->SetMinimumRetryDelay(settings_.minimumRetryDelaySec);
    }
    if (SUCCEEDED(hr)) {
        hr = job->SetRedirectReport();
    }
    if (FAILED(hr)) {
        CancelHalfBuiltJob(*job, id);
        return Failure::WithHResult(Kind::ApplySettings, DescribeHResult(service.get(), hr));
    }

    std::unique_ptr<JobMonitor> created;
    if (cmd.monitor) {
        hr = JobMonitor::Create(factory_, *job, id, cmd.monitor->intervalMillis, created);
        if (FAILED(hr)) {
            CancelHalfBuiltJob(*job, id);
            return Failure::WithHResult(Kind::OtherBits, DescribeHResult(service.get(), hr));
        }
    }

    hr = job->AddFile(cmd.url, settings_.savePathPrefix + cmd.savePath);
    if (FAILED(hr)) {
        created.reset();
        CancelHalfBuiltJob(*job, id);
        return Failure::WithHResult(Kind::AddFile, DescribeHResult(service.get(), hr));
    }

    hr = job->Resume();
    if (FAILED(hr)) {
        created.reset();
        CancelHalfBuiltJob(*job, id);
        return Failure::WithHResult(Kind::Resume, DescribeHResult(service.get(), hr));
    }

    if (created) {
        TrackMonitor(id, *created);
        monitor = std::move(created);
    }

    LOG_INFO(L"Job: Started " + FormatGuid(id) + L" -> " + cmd.savePath);
    StartJobSuccess success;
    success.guid = id;
    return success;
}

CommandResult<MonitorJobCommand> JobController::MonitorJob(const MonitorJobCommand& cmd,
                                                           std::unique_ptr<JobMonitor>& monitor) {
    using Failure = MonitorJobCommand::Failure;
    using Kind = MonitorJobFailureKind;

    std::wstring problem;
    if (!ValidateMonitorConfig(cmd.monitor, problem)) {
        return Failure::WithMessage(Kind::ArgumentValidation, problem);
    }

    std::unique_ptr<TransferService> service;
    std::unique_ptr<TransferJob> job;
    Failure failure;
    if (!OpenOwnedJob(cmd.guid, service, job, failure)) {
        return failure;
    }

    // The new monitor takes over the job's priority and notifications. The previous one
    // must be out of the way before priority is raised again.
    auto it = monitors_.find(cmd.guid);
    if (it != monitors_.end()) {
        it->second.Supersede();
        monitors_.erase(it);
    }

    std::unique_ptr<JobMonitor> created;
    HRESULT hr = JobMonitor::Create(factory_, *job, cmd.guid, cmd.monitor.intervalMillis, created);
    if (FAILED(hr)) {
        return Failure::WithHResult(Kind::OtherBits, DescribeHResult(service.get(), hr));
    }

    TrackMonitor(cmd.guid, *created);
    monitor = std::move(created);

    LOG_INFO(L"Job: Monitoring " + FormatGuid(cmd.guid));
    return EmptySuccess();
}

CommandResult<SuspendJobCommand> JobController::SuspendJob(const SuspendJobCommand& cmd) {
    return RunJobAction<SuspendJobCommand>(cmd.guid, SuspendJobFailureKind::SuspendJob, L"Suspend",
        [](TransferJob& job) { return job.Suspend(); });
}

CommandResult<ResumeJobCommand> JobController::ResumeJob(const ResumeJobCommand& cmd) {
    return RunJobAction<ResumeJobCommand>(cmd.guid, ResumeJobFailureKind::ResumeJob, L"Resume",
        [](TransferJob& job) { return job.Resume(); });
}

CommandResult<SetJobPriorityCommand> JobController::SetJobPriority(const SetJobPriorityCommand& cmd) {
    JobPriority priority = cmd.foreground ? JobPriority::Foreground : JobPriority::Normal;
    return RunJobAction<SetJobPriorityCommand>(cmd.guid, SetJobPriorityFailureKind::ApplySettings,
        cmd.foreground ? L"Foreground" : L"Background",
        [priority](TransferJob& job) { return job.SetPriority(priority); });
}

CommandResult<SetUpdateIntervalCommand> JobController::SetUpdateInterval(
        const SetUpdateIntervalCommand& cmd) {
    using Failure = SetUpdateIntervalCommand::Failure;

    if (!IsValidUpdateInterval(cmd.intervalMillis)) {
        return Failure::WithMessage(SetUpdateIntervalFailureKind::ArgumentValidation,
                                    L"interval out of range");
    }

    auto it = monitors_.find(cmd.guid);
    if (it == monitors_.end()) {
        return Failure::Of(SetUpdateIntervalFailureKind::NotFound);
    }
    if (!it->second.SetInterval(cmd.intervalMillis)) {
        monitors_.erase(it);
        return Failure::Of(SetUpdateIntervalFailureKind::NotFound);
    }

    LOG_DEBUG(L"Job: Interval " + std::to_wstring(cmd.intervalMillis) + L"ms for " +
              FormatGuid(cmd.guid));
    return EmptySuccess();
}

CommandResult<CompleteJobCommand> JobController::CompleteJob(const CompleteJobCommand& cmd) {
    using Failure = CompleteJobCommand::Failure;
    using Kind = CompleteJobFailureKind;

    std::unique_ptr<TransferService> service;
    std::unique_ptr<TransferJob> job;
    Failure failure;
    if (!OpenOwnedJob(cmd.guid, service, job, failure)) {
        return failure;
    }

    HRESULT hr = job->Complete();
    if (FAILED(hr)) {
        return Failure::WithHResult(Kind::CompleteJob, DescribeHResult(service.get(), hr));
    }

    // The job is finished either way, so its monitor goes too
    StopMonitor(cmd.guid);

    if (hr == BG_S_PARTIAL_COMPLETE) {
        LOG_ALERT(L"Job: Partially completed " + FormatGuid(cmd.guid));
        return Failure::WithHResult(Kind::PartialComplete, DescribeHResult(service.get(), hr));
    }
    if (hr == BG_S_UNABLE_TO_DELETE_FILES) {
        LOG_ALERT(L"Job: Completed " + FormatGuid(cmd.guid) + L" but temporary files remain");
    } else {
        LOG_INFO(L"Job: Completed " + FormatGuid(cmd.guid));
    }
    return EmptySuccess();
}

CommandResult<CancelJobCommand> JobController::CancelJob(const CancelJobCommand& cmd) {
    CommandResult<CancelJobCommand> result = RunJobAction<CancelJobCommand>(
        cmd.guid, CancelJobFailureKind::CancelJob, L"Cancel",
        [](TransferJob& job) {
            HRESULT hr = job.Cancel();
            if (hr == BG_S_UNABLE_TO_DELETE_FILES) {
                LOG_ALERT(L"Job: Cancelled but temporary files remain");
            }
            return hr;
        });

    if (std::holds_alternative<EmptySuccess>(result)) {
        StopMonitor(cmd.guid);
    }
    return result;
}

// ============================================================
// Monitor registry
// ============================================================

void JobController::TrackMonitor(const JobId& id, const JobMonitor& monitor) {
    // Drop entries whose monitors have already gone away
    for (auto it = monitors_.begin(); it != monitors_.end();) {
        if (!it->second.IsAlive()) {
            it = monitors_.erase(it);
        } else {
            ++it;
        }
    }
    monitors_[id] = monitor.GetControl();
}

void JobController::StopMonitor(const JobId& id) {
    auto it = monitors_.find(id);
    if (it == monitors_.end()) {
        return;
    }
    it->second.Stop();
    monitors_.erase(it);
}

void JobController::StopAllMonitors() {
    for (auto& entry : monitors_) {
        entry.second.Stop();
    }
    monitors_.clear();
}

} // namespace bitsagent
