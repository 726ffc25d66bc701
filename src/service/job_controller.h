#pragma once
// BitsAgent v1.00 - Job Controller
// Executes commands against the transfer service and maps every service status code
// into the command's typed failure. Keeps weak controls for the live monitors so
// interval changes and stops reach them.

#include "../common/types.h"
#include "../common/guid.h"
#include "../common/protocol.h"
#include "transfer_service.h"
#include "job_monitor.h"
#include <map>
#include <memory>
#include <string>

class JobControllerTest;

namespace bitsagent {

struct JobControllerSettings {
    std::wstring jobName = DEFAULT_JOB_NAME;
    std::wstring savePathPrefix;                 // absolute, ends with a separator
    DWORD minimumRetryDelaySec = DEFAULT_MINIMUM_RETRY_DELAY_SEC;
};

// hr with the service's own description when it has one, else the system text
HResultMessage DescribeHResult(TransferService* service, HRESULT hr);

class JobController {
    friend class ::JobControllerTest;

public:
    JobController(TransferServiceFactory factory, JobControllerSettings settings);
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    // monitor is set when the command carried a monitor config
    CommandResult<StartJobCommand> StartJob(const StartJobCommand& cmd,
                                            std::unique_ptr<JobMonitor>& monitor);
    CommandResult<MonitorJobCommand> MonitorJob(const MonitorJobCommand& cmd,
                                                std::unique_ptr<JobMonitor>& monitor);
    CommandResult<SuspendJobCommand> SuspendJob(const SuspendJobCommand& cmd);
    CommandResult<ResumeJobCommand> ResumeJob(const ResumeJobCommand& cmd);
    CommandResult<SetJobPriorityCommand> SetJobPriority(const SetJobPriorityCommand& cmd);
    CommandResult<SetUpdateIntervalCommand> SetUpdateInterval(const SetUpdateIntervalCommand& cmd);
    CommandResult<CompleteJobCommand> CompleteJob(const CompleteJobCommand& cmd);
    CommandResult<CancelJobCommand> CancelJob(const CancelJobCommand& cmd);

    void StopAllMonitors();
    size_t GetMonitorCount() const { return monitors_.size(); }

private:
    // Connects and opens the job, checking that it belongs to us
    template <typename Failure>
    bool OpenOwnedJob(const JobId& id, std::unique_ptr<TransferService>& service,
                      std::unique_ptr<TransferJob>& job, Failure& failure);

    // Runs one job action for the simple commands (suspend, resume, priority, cancel)
    template <typename Cmd, typename Action>
    CommandResult<Cmd> RunJobAction(const JobId& id, typename Cmd::Failure::Kind actionKind,
                                    const wchar_t* actionName, Action action);

    void TrackMonitor(const JobId& id, const JobMonitor& monitor);
    void StopMonitor(const JobId& id);

    TransferServiceFactory factory_;
    JobControllerSettings settings_;
    std::map<JobId, MonitorControl, GuidLess> monitors_;
};

} // namespace bitsagent
