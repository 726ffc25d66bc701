// BitsAgent v1.00 - Named Pipe Transport Implementation

#include "named_pipe.h"
#include "security.h"
#include "logger.h"
#include <bcrypt.h>

namespace bitsagent {

std::wstring PipeError::Describe() const {
    switch (kind) {
        case PipeErrorKind::None:
            return L"ok";
        case PipeErrorKind::NotConnected:
            return L"pipe not connected";
        case PipeErrorKind::Timeout:
            return L"pipe operation timed out";
        case PipeErrorKind::WriteCount:
            return L"short write: " + std::to_wstring(written) + L" of " +
                   std::to_wstring(expected) + L" bytes";
        case PipeErrorKind::Api:
            return os.Describe();
    }
    return L"unknown pipe error";
}

std::wstring FormatLocalPipePath(const std::wstring& name) {
    return std::wstring(PIPE_PREFIX) + name;
}

bool GenerateRandomPipeName(std::wstring& name, OsError& error) {
    uint8_t random[PIPE_ID_HEX_DIGITS / 2];
    NTSTATUS status = BCryptGenRandom(nullptr, random, static_cast<ULONG>(sizeof(random)),
                                      BCRYPT_USE_SYSTEM_PREFERRED_RNG);
    if (!BCRYPT_SUCCESS(status)) {
        error = OsError(L"BCryptGenRandom", static_cast<DWORD>(status));
        return false;
    }

    static const wchar_t kHex[] = L"0123456789abcdef";
    name.clear();
    name.reserve(PIPE_ID_HEX_DIGITS);
    for (uint8_t b : random) {
        name.push_back(kHex[b >> 4]);
        name.push_back(kHex[b & 0x0F]);
    }
    return true;
}

namespace {

// Shared by server and client. The context is taken from the slot for the duration of the
// call and put back only on success.
PipeError ReadImpl(std::unique_ptr<OverlappedContext>& slot, void* buffer, DWORD capacity,
                   DWORD timeoutMs, DWORD& bytesRead) {
    bytesRead = 0;
    if (!slot) {
        return PipeError::NotConnected();
    }

    OverlappedFinished finished;
    OsError waitError;
    switch (CompleteOverlapped(ReadFileOverlapped(std::move(slot), buffer, capacity),
                               timeoutMs, finished, waitError)) {
        case CompletionStatus::TimedOut:
            return PipeError::Timeout();
        case CompletionStatus::WaitFailed:
            return PipeError::Api(waitError);
        case CompletionStatus::Completed:
            break;
    }

    if (!finished.Succeeded()) {
        return PipeError::Api(finished.error);
    }

    bytesRead = finished.bytesTransferred;
    slot = std::move(finished.context);
    return PipeError::Ok();
}

PipeError WriteImpl(std::unique_ptr<OverlappedContext>& slot, const void* buffer, DWORD size,
                    DWORD timeoutMs) {
    if (!slot) {
        return PipeError::NotConnected();
    }

    OverlappedFinished finished;
    OsError waitError;
    switch (CompleteOverlapped(WriteFileOverlapped(std::move(slot), buffer, size),
                               timeoutMs, finished, waitError)) {
        case CompletionStatus::TimedOut:
            return PipeError::Timeout();
        case CompletionStatus::WaitFailed:
            return PipeError::Api(waitError);
        case CompletionStatus::Completed:
            break;
    }

    if (!finished.Succeeded()) {
        return PipeError::Api(finished.error);
    }
    if (finished.bytesTransferred != size) {
        return PipeError::WriteCount(size, finished.bytesTransferred);
    }

    slot = std::move(finished.context);
    return PipeError::Ok();
}

} // anonymous namespace

// ============================================================
// MessagePipe helpers
// ============================================================

PipeError MessagePipe::ReadMessage(std::vector<uint8_t>& message, size_t capacity,
                                   DWORD timeoutMs) {
    message.assign(capacity, 0);
    DWORD bytesRead = 0;
    PipeError err = Read(message.data(), static_cast<DWORD>(capacity), timeoutMs, bytesRead);
    message.resize(err ? 0 : bytesRead);
    return err;
}

PipeError MessagePipe::WriteMessage(const std::vector<uint8_t>& message, DWORD timeoutMs) {
    return Write(message.data(), static_cast<DWORD>(message.size()), timeoutMs);
}

// ============================================================
// PipeServer
// ============================================================

PipeServer::PipeServer(std::wstring name, SharedHandle pipe)
    : name_(std::move(name))
    , pipe_(std::move(pipe)) {
}

PipeServer::~PipeServer() {
    Disconnect();
}

std::unique_ptr<PipeServer> PipeServer::Create(PipeDirection direction, PipeAccess access,
                                               OsError& error) {
    std::wstring name;
    if (!GenerateRandomPipeName(name, error)) {
        return nullptr;
    }

    PipeSecurityDescriptor security;
    if (access == PipeAccess::LocalService) {
        const wchar_t* sddl = (direction == PipeDirection::Duplex)
            ? SDDL_LOCAL_SERVICE_DUPLEX
            : SDDL_LOCAL_SERVICE_INBOUND;
        if (!security.Initialize(sddl)) {
            error = OsError::FromLastError(L"ConvertStringSecurityDescriptorToSecurityDescriptorW");
            return nullptr;
        }
    }

    DWORD openMode = (direction == PipeDirection::Duplex ? PIPE_ACCESS_DUPLEX : PIPE_ACCESS_INBOUND)
                     | FILE_FLAG_FIRST_PIPE_INSTANCE | FILE_FLAG_OVERLAPPED;
    DWORD pipeMode = PIPE_TYPE_MESSAGE | PIPE_READMODE_MESSAGE | PIPE_WAIT | PIPE_REJECT_REMOTE_CLIENTS;
    DWORD outBuffer = (direction == PipeDirection::Duplex) ? BITSAGENT_PIPE_BUFFER_SIZE : 0;

    std::wstring path = FormatLocalPipePath(name);
    HANDLE raw = CreateNamedPipeW(
        path.c_str(),
        openMode,
        pipeMode,
        1,                              // single instance
        outBuffer,
        BITSAGENT_PIPE_BUFFER_SIZE,     // input buffer size
        0,                              // default timeout
        security.GetSecurityAttributes()
    );

    if (raw == INVALID_HANDLE_VALUE) {
        error = OsError::FromLastError(L"CreateNamedPipeW");
        return nullptr;
    }

    LOG_DEBUG(L"Pipe: Created " + path);
    return std::unique_ptr<PipeServer>(new PipeServer(std::move(name), MakeSharedHandle(raw)));
}

PipeError PipeServer::Connect(DWORD timeoutMs) {
    Disconnect();

    OsError error;
    std::unique_ptr<OverlappedContext> context = OverlappedContext::Create(pipe_, error);
    if (!context) {
        return PipeError::Api(error);
    }

    OverlappedFinished finished;
    OsError waitError;
    switch (CompleteOverlapped(ConnectNamedPipeOverlapped(std::move(context)),
                               timeoutMs, finished, waitError)) {
        case CompletionStatus::TimedOut:
            return PipeError::Timeout();
        case CompletionStatus::WaitFailed:
            return PipeError::Api(waitError);
        case CompletionStatus::Completed:
            break;
    }

    if (!finished.Succeeded()) {
        return PipeError::Api(finished.error);
    }

    context_ = std::move(finished.context);
    return PipeError::Ok();
}

void PipeServer::Disconnect() {
    if (!context_) {
        return;
    }
    context_.reset();

    if (!DisconnectNamedPipe(pipe_.get())) {
        LOG_DEBUG(L"Pipe: " + OsError::FromLastError(L"DisconnectNamedPipe").Describe());
    }
}

PipeError PipeServer::Read(void* buffer, DWORD capacity, DWORD timeoutMs, DWORD& bytesRead) {
    PipeError err = ReadImpl(context_, buffer, capacity, timeoutMs, bytesRead);
    if (err && err.kind != PipeErrorKind::NotConnected) {
        // context_ is already empty; drop the kernel side of the connection too
        if (!DisconnectNamedPipe(pipe_.get())) {
            LOG_DEBUG(L"Pipe: " + OsError::FromLastError(L"DisconnectNamedPipe").Describe());
        }
    }
    return err;
}

PipeError PipeServer::Write(const void* buffer, DWORD size, DWORD timeoutMs) {
    PipeError err = WriteImpl(context_, buffer, size, timeoutMs);
    if (err && err.kind != PipeErrorKind::NotConnected) {
        if (!DisconnectNamedPipe(pipe_.get())) {
            LOG_DEBUG(L"Pipe: " + OsError::FromLastError(L"DisconnectNamedPipe").Describe());
        }
    }
    return err;
}

// ============================================================
// PipeClient
// ============================================================

PipeClient::PipeClient(std::unique_ptr<OverlappedContext> context)
    : context_(std::move(context)) {
}

std::unique_ptr<PipeClient> PipeClient::Open(const std::wstring& name, DWORD desiredAccess,
                                             bool messageMode, OsError& error) {
    std::wstring path = FormatLocalPipePath(name);
    HANDLE raw = CreateFileW(
        path.c_str(),
        desiredAccess,
        0,
        nullptr,
        OPEN_EXISTING,
        FILE_FLAG_OVERLAPPED,
        nullptr
    );

    if (raw == INVALID_HANDLE_VALUE) {
        error = OsError::FromLastError(L"CreateFileW");
        return nullptr;
    }
    SharedHandle pipe = MakeSharedHandle(raw);

    if (messageMode) {
        DWORD mode = PIPE_READMODE_MESSAGE;
        if (!SetNamedPipeHandleState(pipe.get(), &mode, nullptr, nullptr)) {
            error = OsError::FromLastError(L"SetNamedPipeHandleState");
            return nullptr;
        }
    }

    std::unique_ptr<OverlappedContext> context = OverlappedContext::Create(pipe, error);
    if (!context) {
        return nullptr;
    }
    return std::unique_ptr<PipeClient>(new PipeClient(std::move(context)));
}

std::unique_ptr<PipeClient> PipeClient::OpenDuplex(const std::wstring& name, OsError& error) {
    return Open(name, GENERIC_READ | GENERIC_WRITE, true, error);
}

std::unique_ptr<PipeClient> PipeClient::OpenOutbound(const std::wstring& name, OsError& error) {
    return Open(name, GENERIC_WRITE, false, error);
}

PipeError PipeClient::Read(void* buffer, DWORD capacity, DWORD timeoutMs, DWORD& bytesRead) {
    return ReadImpl(context_, buffer, capacity, timeoutMs, bytesRead);
}

PipeError PipeClient::Write(const void* buffer, DWORD size, DWORD timeoutMs) {
    return WriteImpl(context_, buffer, size, timeoutMs);
}

} // namespace bitsagent
