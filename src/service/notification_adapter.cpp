// BitsAgent v1.00 - Job Notification Adapter Implementation

#include "notification_adapter.h"
#include "../common/logger.h"
#include <exception>

namespace bitsagent {

Microsoft::WRL::ComPtr<NotificationAdapter> NotificationAdapter::Create(JobNotificationHandlers handlers) {
    Microsoft::WRL::ComPtr<NotificationAdapter> adapter;
    // Attach takes over the initial reference instead of adding one
    adapter.Attach(new NotificationAdapter(std::move(handlers)));
    return adapter;
}

DWORD NotificationAdapter::NotifyFlagsFor(const JobNotificationHandlers& handlers) {
    DWORD flags = 0;
    if (handlers.transferred) flags |= BG_NOTIFY_JOB_TRANSFERRED;
    if (handlers.error) flags |= BG_NOTIFY_JOB_ERROR;
    if (handlers.modification) flags |= BG_NOTIFY_JOB_MODIFICATION;
    return flags;
}

NotificationAdapter::NotificationAdapter(JobNotificationHandlers handlers)
    : refCount_(1)
    , handlers_(std::move(handlers)) {
}

STDMETHODIMP NotificationAdapter::QueryInterface(REFIID riid, void** object) {
    if (!object) {
        return E_POINTER;
    }
    if (IsEqualIID(riid, __uuidof(IUnknown)) || IsEqualIID(riid, __uuidof(IBackgroundCopyCallback))) {
        *object = static_cast<IBackgroundCopyCallback*>(this);
        AddRef();
        return S_OK;
    }
    *object = nullptr;
    return E_NOINTERFACE;
}

STDMETHODIMP_(ULONG) NotificationAdapter::AddRef() {
    return refCount_.fetch_add(1) + 1;
}

STDMETHODIMP_(ULONG) NotificationAdapter::Release() {
    ULONG remaining = refCount_.fetch_sub(1) - 1;
    if (remaining == 0) {
        delete this;
    }
    return remaining;
}

HRESULT NotificationAdapter::Invoke(const std::function<HRESULT()>& handler, const wchar_t* eventName) {
    if (!handler) {
        return S_OK;
    }
    try {
        return handler();
    }
    catch (const std::exception& e) {
        LOG_ERROR(std::wstring(L"Notify: ") + eventName + L" handler failed - " +
                  Utf8ToWide(e.what()));
        return E_FAIL;
    }
    catch (...) {
        LOG_ERROR(std::wstring(L"Notify: ") + eventName + L" handler failed - unknown exception");
        return E_FAIL;
    }
}

STDMETHODIMP NotificationAdapter::JobTransferred(IBackgroundCopyJob*) {
    return Invoke(handlers_.transferred, L"JobTransferred");
}

STDMETHODIMP NotificationAdapter::JobError(IBackgroundCopyJob*, IBackgroundCopyError*) {
    return Invoke(handlers_.error, L"JobError");
}

STDMETHODIMP NotificationAdapter::JobModification(IBackgroundCopyJob*, DWORD) {
    return Invoke(handlers_.modification, L"JobModification");
}

} // namespace bitsagent
