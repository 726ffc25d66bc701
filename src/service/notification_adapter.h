#pragma once
// BitsAgent v1.00 - Job Notification Adapter
// IBackgroundCopyCallback implementation that forwards job events to local handlers.
// The transfer service holds references and calls it from its own threads, possibly
// after the registering code has finished, so the object lives exactly as long as its
// reference count.

#include "../common/types.h"
#include "transfer_service.h"
#include <bits.h>
#include <wrl/client.h>
#include <atomic>

namespace bitsagent {

class NotificationAdapter : public IBackgroundCopyCallback {
public:
    // Returned with one reference, owned by the ComPtr
    static Microsoft::WRL::ComPtr<NotificationAdapter> Create(JobNotificationHandlers handlers);

    // BG_NOTIFY_* flags for the handlers that are present
    static DWORD NotifyFlagsFor(const JobNotificationHandlers& handlers);

    // IUnknown
    STDMETHODIMP QueryInterface(REFIID riid, void** object) override;
    STDMETHODIMP_(ULONG) AddRef() override;
    STDMETHODIMP_(ULONG) Release() override;

    // IBackgroundCopyCallback
    STDMETHODIMP JobTransferred(IBackgroundCopyJob* job) override;
    STDMETHODIMP JobError(IBackgroundCopyJob* job, IBackgroundCopyError* error) override;
    STDMETHODIMP JobModification(IBackgroundCopyJob* job, DWORD reserved) override;

    NotificationAdapter(const NotificationAdapter&) = delete;
    NotificationAdapter& operator=(const NotificationAdapter&) = delete;

private:
    explicit NotificationAdapter(JobNotificationHandlers handlers);
    ~NotificationAdapter() = default;

    // Runs the handler inside a fault boundary; absent handler is S_OK.
    // Only C++ exceptions are caught. Structured exceptions such as access violations
    // still reach the service's calling thread.
    static HRESULT Invoke(const std::function<HRESULT()>& handler, const wchar_t* eventName);

    std::atomic<ULONG> refCount_;
    JobNotificationHandlers handlers_;
};

} // namespace bitsagent
