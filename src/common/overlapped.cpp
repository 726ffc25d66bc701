// BitsAgent v1.00 - Overlapped I/O Engine Implementation

#include "overlapped.h"
#include "logger.h"

namespace bitsagent {

std::wstring FormatSystemMessage(DWORD code) {
    wchar_t* raw = nullptr;
    DWORD len = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, 0, reinterpret_cast<LPWSTR>(&raw), 0, nullptr);
    ScopedLocalMem owner(raw);
    if (len == 0 || !raw) {
        return L"";
    }

    std::wstring text(raw, len);
    size_t end = text.find_last_not_of(L" \r\n");
    return (end == std::wstring::npos) ? std::wstring() : text.substr(0, end + 1);
}

std::wstring OsError::Describe() const {
    std::wstring result = function ? function : L"(unknown)";
    result += L" failed (" + std::to_wstring(code) + L")";
    std::wstring text = FormatSystemMessage(code);
    if (!text.empty()) {
        result += L": " + text;
    }
    return result;
}

// ============================================================
// Event
// ============================================================

std::optional<Event> Event::Create(OsError& error) {
    ScopedHandle handle = MakeScopedHandle(CreateEventW(nullptr, TRUE, FALSE, nullptr));
    if (!handle) {
        error = OsError::FromLastError(L"CreateEventW");
        return std::nullopt;
    }
    return Event(std::move(handle));
}

Event::WaitOutcome Event::Wait(DWORD timeoutMs, OsError& error) const {
    DWORD result = WaitForSingleObject(handle_.get(), timeoutMs);
    switch (result) {
        case WAIT_OBJECT_0:
            return WaitOutcome::Signaled;
        case WAIT_TIMEOUT:
            return WaitOutcome::TimedOut;
        default:
            error = OsError::FromLastError(L"WaitForSingleObject");
            return WaitOutcome::Failed;
    }
}

// ============================================================
// OverlappedContext
// ============================================================

OverlappedContext::OverlappedContext(SharedHandle file, Event event)
    : event_(std::move(event))
    , file_(std::move(file)) {
    ZeroMemory(&overlapped_, sizeof(overlapped_));
    overlapped_.hEvent = event_.Get();
}

std::unique_ptr<OverlappedContext> OverlappedContext::Create(SharedHandle file, OsError& error) {
    std::optional<Event> event = Event::Create(error);
    if (!event) {
        return nullptr;
    }
    return std::unique_ptr<OverlappedContext>(
        new OverlappedContext(std::move(file), std::move(*event)));
}

void OverlappedContext::Rearm() {
    ZeroMemory(&overlapped_, sizeof(overlapped_));
    overlapped_.hEvent = event_.Get();
    event_.Reset();
}

// ============================================================
// OverlappedPending
// ============================================================

OverlappedPending::OverlappedPending(std::unique_ptr<OverlappedContext> context,
                                     const wchar_t* function)
    : context_(std::move(context))
    , function_(function) {
}

OverlappedPending::~OverlappedPending() {
    CancelAndWait();
}

OverlappedPending::OverlappedPending(OverlappedPending&& other) noexcept
    : context_(std::move(other.context_))
    , function_(other.function_) {
}

OverlappedPending& OverlappedPending::operator=(OverlappedPending&& other) noexcept {
    if (this != &other) {
        CancelAndWait();
        context_ = std::move(other.context_);
        function_ = other.function_;
    }
    return *this;
}

Event::WaitOutcome OverlappedPending::Wait(DWORD timeoutMs, OsError& error) const {
    if (!context_) {
        return Event::WaitOutcome::Signaled;
    }
    return context_->GetEvent().Wait(timeoutMs, error);
}

std::optional<OverlappedFinished> OverlappedPending::Finish() {
    if (!context_) {
        return std::nullopt;
    }

    DWORD bytesTransferred = 0;
    BOOL ok = GetOverlappedResult(context_->File(), context_->Get(), &bytesTransferred, FALSE);
    DWORD lastError = ok ? ERROR_SUCCESS : GetLastError();

    if (!ok && lastError == ERROR_IO_INCOMPLETE) {
        return std::nullopt;
    }

    OverlappedFinished finished;
    finished.context = std::move(context_);
    if (ok) {
        finished.bytesTransferred = bytesTransferred;
    } else {
        finished.error = OsError(function_, lastError);
    }
    return finished;
}

void OverlappedPending::CancelAndWait() noexcept {
    if (!context_) {
        return;
    }

    // ERROR_NOT_FOUND: the call completed before the cancel reached it
    if (CancelIoEx(context_->File(), context_->Get()) || GetLastError() == ERROR_NOT_FOUND) {
        DWORD bytesTransferred = 0;
        GetOverlappedResult(context_->File(), context_->Get(), &bytesTransferred, TRUE);
        context_.reset();
        return;
    }

    // The kernel may still write into the block; leaking it is the only safe outcome
    DWORD error = GetLastError();
    LOG_ERROR(L"Overlapped: CancelIoEx failed (" + std::to_wstring(error) +
              L") for " + (function_ ? function_ : L"(unknown)") + L", context leaked");
    static_cast<void>(context_.release());
}

// ============================================================
// Issue functions
// ============================================================

namespace {
OverlappedResult MakeResult(std::unique_ptr<OverlappedContext> context, const wchar_t* function,
                            BOOL ok, DWORD lastError, DWORD bytesTransferred) {
    if (!ok && lastError == ERROR_IO_PENDING) {
        return OverlappedPending(std::move(context), function);
    }

    OverlappedFinished finished;
    finished.context = std::move(context);
    if (ok) {
        finished.bytesTransferred = bytesTransferred;
    } else {
        finished.error = OsError(function, lastError);
    }
    return finished;
}
} // anonymous namespace

OverlappedResult ConnectNamedPipeOverlapped(std::unique_ptr<OverlappedContext> context) {
    context->Rearm();
    BOOL ok = ConnectNamedPipe(context->File(), context->Get());
    DWORD lastError = ok ? ERROR_SUCCESS : GetLastError();

    // A client that connected between create and connect is a success
    if (!ok && lastError == ERROR_PIPE_CONNECTED) {
        ok = TRUE;
        lastError = ERROR_SUCCESS;
    }
    return MakeResult(std::move(context), L"ConnectNamedPipe", ok, lastError, 0);
}

OverlappedResult ReadFileOverlapped(std::unique_ptr<OverlappedContext> context,
                                    void* buffer, DWORD size) {
    context->Rearm();
    DWORD bytesTransferred = 0;
    BOOL ok = ReadFile(context->File(), buffer, size, &bytesTransferred, context->Get());
    DWORD lastError = ok ? ERROR_SUCCESS : GetLastError();
    return MakeResult(std::move(context), L"ReadFile", ok, lastError, bytesTransferred);
}

OverlappedResult WriteFileOverlapped(std::unique_ptr<OverlappedContext> context,
                                     const void* buffer, DWORD size) {
    context->Rearm();
    DWORD bytesTransferred = 0;
    BOOL ok = WriteFile(context->File(), buffer, size, &bytesTransferred, context->Get());
    DWORD lastError = ok ? ERROR_SUCCESS : GetLastError();
    return MakeResult(std::move(context), L"WriteFile", ok, lastError, bytesTransferred);
}

CompletionStatus CompleteOverlapped(OverlappedResult&& result, DWORD timeoutMs,
                                    OverlappedFinished& finished, OsError& waitError) {
    if (auto* done = std::get_if<OverlappedFinished>(&result)) {
        finished = std::move(*done);
        return CompletionStatus::Completed;
    }

    OverlappedPending pending = std::move(std::get<OverlappedPending>(result));

    switch (pending.Wait(timeoutMs, waitError)) {
        case Event::WaitOutcome::TimedOut:
            return CompletionStatus::TimedOut;
        case Event::WaitOutcome::Failed:
            return CompletionStatus::WaitFailed;
        case Event::WaitOutcome::Signaled:
            break;
    }

    std::optional<OverlappedFinished> polled = pending.Finish();
    if (!polled) {
        waitError = OsError(L"GetOverlappedResult", ERROR_IO_INCOMPLETE);
        return CompletionStatus::WaitFailed;
    }
    finished = std::move(*polled);
    return CompletionStatus::Completed;
}

} // namespace bitsagent
