#pragma once
// BitsAgent v1.00 - Job Monitor
// Produces status snapshots for one job. Service notifications wake the monitor early;
// otherwise it polls at the configured interval.
//
// The monitor owns MonitorState through a shared_ptr. Notification handlers and the
// controller's registry hold only weak_ptrs, so they fail cleanly once the monitor is gone.

#include "../common/types.h"
#include "../common/guid.h"
#include "../common/protocol.h"
#include "transfer_service.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace bitsagent {

struct MonitorState {
    std::mutex mutex;
    std::condition_variable changed;
    DWORD intervalMs = DEFAULT_MONITOR_INTERVAL_MS;
    bool notified = false;
    bool shutdown = false;        // false -> true only
    bool keepPriority = false;    // a newer monitor owns the job's priority

    // Held for the whole priority restore; Supersede takes it so no restore lands after it
    std::mutex priorityMutex;
};

// Weak handle kept by the controller. All calls fail once the monitor is destroyed.
class MonitorControl {
public:
    MonitorControl() = default;
    explicit MonitorControl(std::weak_ptr<MonitorState> state) : state_(std::move(state)) {}

    bool SetInterval(DWORD intervalMs);
    bool Stop();

    // Stop without restoring priority, for when another monitor takes over the job.
    // Waits for a restore already in progress, so the caller may raise priority afterwards.
    bool Supersede();

    bool IsAlive() const { return !state_.expired(); }

private:
    std::weak_ptr<MonitorState> state_;
};

enum class MonitorResultKind : uint8_t {
    Ok = 0,
    NotConnected,   // monitor was already shut down
    Timeout,        // no snapshot within the call's timeout; monitor is now shut down
    Failed          // fetching status failed; monitor is now shut down
};

struct MonitorResult {
    MonitorResultKind kind = MonitorResultKind::Ok;
    HRESULT hr = S_OK;

    bool IsError() const { return kind != MonitorResultKind::Ok; }
    explicit operator bool() const { return IsError(); }

    static MonitorResult Ok() { return MonitorResult(); }
    static MonitorResult Make(MonitorResultKind k, HRESULT code = S_OK) {
        MonitorResult r;
        r.kind = k;
        r.hr = code;
        return r;
    }

    std::wstring Describe() const;
};

class JobMonitor {
public:
    using Clock = std::chrono::steady_clock;

    // Raises the job to foreground priority and registers the transferred and error
    // handlers. On failure nothing stays registered against the monitor's state.
    static HRESULT Create(TransferServiceFactory factory, TransferJob& job, const JobId& id,
                          DWORD intervalMs, std::unique_ptr<JobMonitor>& monitor);

    ~JobMonitor();

    JobMonitor(const JobMonitor&) = delete;
    JobMonitor& operator=(const JobMonitor&) = delete;

    const JobId& GetJobId() const { return id_; }
    MonitorControl GetControl() const { return MonitorControl(state_); }

    // Blocks until a snapshot is due, a notification arrives, or timeoutMs passes
    // (INFINITE waits without a deadline). The first call fetches at once.
    MonitorResult GetStatus(DWORD timeoutMs, JobStatus& status);

    void Stop();

private:
    JobMonitor(TransferServiceFactory factory, const JobId& id, DWORD intervalMs);

    HRESULT FetchStatus(JobStatus& status);
    MonitorResult ShutDown(MonitorResultKind kind, HRESULT hr = S_OK);

    // Back to normal priority, at most once per monitor
    void RestorePriority();

    TransferServiceFactory factory_;
    JobId id_;
    std::shared_ptr<MonitorState> state_;
    std::optional<Clock::time_point> lastStatus_;
    std::optional<std::wstring> lastUrl_;
    std::atomic<bool> priorityRestored_;
};

} // namespace bitsagent
