#pragma once
// BitsAgent v1.00 - RAII Handle Management
// Zero-overhead abstraction for Windows HANDLEs and COM lifetimes

// Prevent Windows macro conflicts
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#include <windows.h>
#include <objbase.h>
#include <memory>

namespace bitsagent {

// Custom deleter for Windows HANDLEs
struct HandleDeleter {
    using pointer = HANDLE;
    void operator()(HANDLE h) const noexcept {
        if (h && h != INVALID_HANDLE_VALUE) {
            ::CloseHandle(h);
        }
    }
};

// RAII wrapper for HANDLE
using ScopedHandle = std::unique_ptr<void, HandleDeleter>;

// Factory function for creating ScopedHandle
inline ScopedHandle MakeScopedHandle(HANDLE h) noexcept {
    return ScopedHandle((h && h != INVALID_HANDLE_VALUE) ? h : nullptr);
}

// Handle shared between an endpoint and its in-flight overlapped operation.
// The operation keeps the handle open until its cancellation has been acknowledged.
using SharedHandle = std::shared_ptr<void>;

inline SharedHandle MakeSharedHandle(HANDLE h) {
    if (!h || h == INVALID_HANDLE_VALUE) {
        return SharedHandle();
    }
    return SharedHandle(h, HandleDeleter());
}

// Custom deleter for LocalAlloc'd memory (security descriptors)
struct LocalMemDeleter {
    void operator()(void* p) const noexcept {
        if (p) {
            ::LocalFree(p);
        }
    }
};

using ScopedLocalMem = std::unique_ptr<void, LocalMemDeleter>;

// Custom deleter for CoTaskMemAlloc'd strings returned by COM getters
struct CoTaskMemDeleter {
    void operator()(void* p) const noexcept {
        if (p) {
            ::CoTaskMemFree(p);
        }
    }
};

using ScopedCoTaskString = std::unique_ptr<wchar_t, CoTaskMemDeleter>;

// RAII wrapper for CoInitializeEx / CoUninitialize on the calling thread
class ComApartment {
public:
    explicit ComApartment(DWORD model = COINIT_MULTITHREADED) noexcept
        : hr_(::CoInitializeEx(nullptr, model)) {
    }

    ~ComApartment() noexcept {
        if (SUCCEEDED(hr_)) {
            ::CoUninitialize();
        }
    }

    ComApartment(const ComApartment&) = delete;
    ComApartment& operator=(const ComApartment&) = delete;

    bool IsInitialized() const noexcept { return SUCCEEDED(hr_); }
    HRESULT GetResult() const noexcept { return hr_; }

private:
    HRESULT hr_;
};

// RAII wrapper for critical sections
class CriticalSection {
public:
    CriticalSection() noexcept {
        ::InitializeCriticalSection(&cs_);
    }

    ~CriticalSection() noexcept {
        ::DeleteCriticalSection(&cs_);
    }

    CriticalSection(const CriticalSection&) = delete;
    CriticalSection& operator=(const CriticalSection&) = delete;

    void lock() noexcept {
        ::EnterCriticalSection(&cs_);
    }

    void unlock() noexcept {
        ::LeaveCriticalSection(&cs_);
    }

    bool try_lock() noexcept {
        return ::TryEnterCriticalSection(&cs_) != 0;
    }

private:
    CRITICAL_SECTION cs_;
};

// RAII lock guard for CriticalSection
class CSLockGuard {
public:
    explicit CSLockGuard(CriticalSection& cs) noexcept : cs_(cs) {
        cs_.lock();
    }

    ~CSLockGuard() noexcept {
        cs_.unlock();
    }

    CSLockGuard(const CSLockGuard&) = delete;
    CSLockGuard& operator=(const CSLockGuard&) = delete;

private:
    CriticalSection& cs_;
};

} // namespace bitsagent
