#pragma once
// BitsAgent v1.00 - Transfer Service Binding
// Abstract view of the OS transfer service. The worker runs against the BITS
// implementation; tests substitute an in-memory one.

#include "../common/types.h"
#include "../common/guid.h"
#include "../common/protocol.h"
#include <functional>
#include <memory>
#include <string>

namespace bitsagent {

enum class JobPriority : uint8_t {
    Foreground,
    Normal
};

// Callbacks handed to the service for one job. Each may run on any thread at any time,
// so they must capture only independently owned state.
struct JobNotificationHandlers {
    std::function<HRESULT()> transferred;
    std::function<HRESULT()> error;
    std::function<HRESULT()> modification;
};

class TransferJob {
public:
    virtual ~TransferJob() = default;

    virtual HRESULT GetId(JobId& id) = 0;
    virtual HRESULT GetDisplayName(std::wstring& name) = 0;
    virtual HRESULT AddFile(const std::wstring& remoteUrl, const std::wstring& localPath) = 0;
    virtual HRESULT SetPriority(JobPriority priority) = 0;
    virtual HRESULT SetProxyUsage(ProxyUsage usage) = 0;
    virtual HRESULT SetMinimumRetryDelay(DWORD seconds) = 0;

    // Keep following redirects but record the final URL
    virtual HRESULT SetRedirectReport() = 0;

    virtual HRESULT Suspend() = 0;
    virtual HRESULT Resume() = 0;
    virtual HRESULT Complete() = 0;
    virtual HRESULT Cancel() = 0;

    // Everything except the url field
    virtual HRESULT GetStatus(JobStatus& status) = 0;
    virtual HRESULT GetFirstFileRemoteName(std::wstring& url) = 0;

    // Replaces any previously registered handlers for this job
    virtual HRESULT RegisterNotifications(const JobNotificationHandlers& handlers) = 0;
};

class TransferService {
public:
    virtual ~TransferService() = default;

    virtual HRESULT CreateJob(const std::wstring& displayName, std::unique_ptr<TransferJob>& job) = 0;

    // BG_E_NOT_FOUND when no such job exists for this user
    virtual HRESULT GetJob(const JobId& id, std::unique_ptr<TransferJob>& job) = 0;

    // Service text for hr; false when it has none
    virtual bool GetErrorDescription(HRESULT hr, std::wstring& description) = 0;
};

// Connects a fresh binding; called once per command and once per monitor fetch
using TransferServiceFactory = std::function<HRESULT(std::unique_ptr<TransferService>&)>;

} // namespace bitsagent
