#pragma once
// BitsAgent v1.00 - Overlapped I/O Engine
// One asynchronous call at a time per context, with cancel-and-wait on abandonment

#include "types.h"
#include "scoped_handle.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace bitsagent {

// Win32 failure: the API that failed and its GetLastError() code
struct OsError {
    const wchar_t* function = nullptr;
    DWORD code = ERROR_SUCCESS;

    OsError() = default;
    OsError(const wchar_t* fn, DWORD c) : function(fn), code(c) {}

    static OsError FromLastError(const wchar_t* fn) { return OsError(fn, GetLastError()); }

    bool IsSet() const { return code != ERROR_SUCCESS; }

    // "ReadFile failed (109): The pipe has been ended."
    std::wstring Describe() const;
};

// Text for a Win32 error or HRESULT from the system message table
std::wstring FormatSystemMessage(DWORD code);

// Manual-reset event owned by one OverlappedContext
class Event {
public:
    static std::optional<Event> Create(OsError& error);

    HANDLE Get() const { return handle_.get(); }
    bool Reset() const { return ResetEvent(handle_.get()) != FALSE; }

    enum class WaitOutcome { Signaled, TimedOut, Failed };
    WaitOutcome Wait(DWORD timeoutMs, OsError& error) const;

private:
    explicit Event(ScopedHandle handle) : handle_(std::move(handle)) {}
    ScopedHandle handle_;
};

// OVERLAPPED block plus its event and the file it targets.
// Heap allocated so the OVERLAPPED address stays fixed while the kernel references it.
class OverlappedContext {
public:
    static std::unique_ptr<OverlappedContext> Create(SharedHandle file, OsError& error);

    OVERLAPPED* Get() { return &overlapped_; }
    HANDLE File() const { return file_.get(); }
    const Event& GetEvent() const { return event_; }

    // Prepare for the next call: zero the block and unsignal the event
    void Rearm();

    OverlappedContext(const OverlappedContext&) = delete;
    OverlappedContext& operator=(const OverlappedContext&) = delete;

private:
    OverlappedContext(SharedHandle file, Event event);

    OVERLAPPED overlapped_;
    Event event_;
    SharedHandle file_;
};

// Outcome of a call that is no longer in flight.
// The context is handed back so the owner can issue the next call with it.
struct OverlappedFinished {
    std::unique_ptr<OverlappedContext> context;
    DWORD bytesTransferred = 0;
    OsError error;

    bool Succeeded() const { return !error.IsSet(); }
};

// A call the kernel is still working on. Move-only.
// Destroying it before it finishes cancels the call and blocks until the cancellation
// is acknowledged, so the context and any buffer handed to the call outlive the kernel's use.
class OverlappedPending {
public:
    OverlappedPending(std::unique_ptr<OverlappedContext> context, const wchar_t* function);
    ~OverlappedPending();

    OverlappedPending(OverlappedPending&& other) noexcept;
    OverlappedPending& operator=(OverlappedPending&& other) noexcept;
    OverlappedPending(const OverlappedPending&) = delete;
    OverlappedPending& operator=(const OverlappedPending&) = delete;

    // Block up to timeoutMs (INFINITE allowed); the call stays pending either way
    Event::WaitOutcome Wait(DWORD timeoutMs, OsError& error) const;

    // Non-blocking poll. Returns nullopt while the call is incomplete.
    // Once a value is returned this object is empty and its destructor does nothing.
    std::optional<OverlappedFinished> Finish();

    bool IsActive() const { return context_ != nullptr; }

private:
    void CancelAndWait() noexcept;

    std::unique_ptr<OverlappedContext> context_;
    const wchar_t* function_;
};

using OverlappedResult = std::variant<OverlappedPending, OverlappedFinished>;

// Issue one call on the context's file. ERROR_IO_PENDING yields Pending; anything else
// (including synchronous completion) yields Finished. The buffer must stay valid until the
// result is finished or the pending value has been destroyed.
OverlappedResult ConnectNamedPipeOverlapped(std::unique_ptr<OverlappedContext> context);
OverlappedResult ReadFileOverlapped(std::unique_ptr<OverlappedContext> context,
                                    void* buffer, DWORD size);
OverlappedResult WriteFileOverlapped(std::unique_ptr<OverlappedContext> context,
                                     const void* buffer, DWORD size);

enum class CompletionStatus {
    Completed,   // finished holds the outcome (which may itself be an I/O failure)
    TimedOut,    // the call was cancelled and its context released
    WaitFailed   // waiting failed; waitError is set and the call was cancelled
};

// Drive a result to completion within timeoutMs
CompletionStatus CompleteOverlapped(OverlappedResult&& result, DWORD timeoutMs,
                                    OverlappedFinished& finished, OsError& waitError);

} // namespace bitsagent
