#pragma once
// BitsAgent v1.00 - BITS Transfer Service Binding
// TransferService over IBackgroundCopyManager. The calling thread must be in a COM apartment.

#include "../common/types.h"
#include "transfer_service.h"
#include <bits.h>
#include <wrl/client.h>

namespace bitsagent {

class BitsTransferJob : public TransferJob {
public:
    explicit BitsTransferJob(Microsoft::WRL::ComPtr<IBackgroundCopyJob> job);

    HRESULT GetId(JobId& id) override;
    HRESULT GetDisplayName(std::wstring& name) override;
    HRESULT AddFile(const std::wstring& remoteUrl, const std::wstring& localPath) override;
    HRESULT SetPriority(JobPriority priority) override;
    HRESULT SetProxyUsage(ProxyUsage usage) override;
    HRESULT SetMinimumRetryDelay(DWORD seconds) override;
    HRESULT SetRedirectReport() override;
    HRESULT Suspend() override;
    HRESULT Resume() override;
    HRESULT Complete() override;
    HRESULT Cancel() override;
    HRESULT GetStatus(JobStatus& status) override;
    HRESULT GetFirstFileRemoteName(std::wstring& url) override;
    HRESULT RegisterNotifications(const JobNotificationHandlers& handlers) override;

private:
    Microsoft::WRL::ComPtr<IBackgroundCopyJob> job_;
};

class BitsTransferService : public TransferService {
public:
    // Connects to the local BITS manager
    static HRESULT Connect(std::unique_ptr<TransferService>& service);

    HRESULT CreateJob(const std::wstring& displayName, std::unique_ptr<TransferJob>& job) override;
    HRESULT GetJob(const JobId& id, std::unique_ptr<TransferJob>& job) override;
    bool GetErrorDescription(HRESULT hr, std::wstring& description) override;

private:
    explicit BitsTransferService(Microsoft::WRL::ComPtr<IBackgroundCopyManager> manager);

    Microsoft::WRL::ComPtr<IBackgroundCopyManager> manager_;
};

} // namespace bitsagent
