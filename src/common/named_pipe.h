#pragma once
// BitsAgent v1.00 - Named Pipe Transport
// Message-mode pipes over the overlapped engine; any failure leaves the endpoint disconnected

#include "types.h"
#include "scoped_handle.h"
#include "overlapped.h"
#include <memory>
#include <string>
#include <vector>

namespace bitsagent {

enum class PipeErrorKind : uint8_t {
    None = 0,
    NotConnected,   // no connection (never connected, or dropped by an earlier failure)
    Timeout,        // call did not finish in time and was cancelled
    WriteCount,     // message accepted only partially
    Api             // Win32 failure, see os
};

struct PipeError {
    PipeErrorKind kind = PipeErrorKind::None;
    OsError os;
    DWORD expected = 0;
    DWORD written = 0;

    bool IsError() const { return kind != PipeErrorKind::None; }
    explicit operator bool() const { return IsError(); }

    static PipeError Ok() { return PipeError(); }
    static PipeError NotConnected() { return Make(PipeErrorKind::NotConnected); }
    static PipeError Timeout() { return Make(PipeErrorKind::Timeout); }
    static PipeError Api(const OsError& error) {
        PipeError e = Make(PipeErrorKind::Api);
        e.os = error;
        return e;
    }
    static PipeError WriteCount(DWORD expectedBytes, DWORD writtenBytes) {
        PipeError e = Make(PipeErrorKind::WriteCount);
        e.expected = expectedBytes;
        e.written = writtenBytes;
        return e;
    }

    std::wstring Describe() const;

private:
    static PipeError Make(PipeErrorKind k) {
        PipeError e;
        e.kind = k;
        return e;
    }
};

enum class PipeDirection { Duplex, Inbound };

// Who may open a created server pipe
enum class PipeAccess { Default, LocalService };

// One connected message channel. Not thread-safe: one call in flight per endpoint.
class MessagePipe {
public:
    virtual ~MessagePipe() = default;

    // Receive exactly one message of up to capacity bytes
    virtual PipeError Read(void* buffer, DWORD capacity, DWORD timeoutMs, DWORD& bytesRead) = 0;

    // Send the whole buffer as one message
    virtual PipeError Write(const void* buffer, DWORD size, DWORD timeoutMs) = 0;

    virtual bool IsConnected() const = 0;
    virtual void Disconnect() = 0;

    PipeError ReadMessage(std::vector<uint8_t>& message, size_t capacity, DWORD timeoutMs);
    PipeError WriteMessage(const std::vector<uint8_t>& message, DWORD timeoutMs);
};

class PipeServer : public MessagePipe {
public:
    // New first-instance pipe with a random 32-hex-digit name
    static std::unique_ptr<PipeServer> Create(PipeDirection direction, PipeAccess access,
                                              OsError& error);

    ~PipeServer() override;

    PipeServer(const PipeServer&) = delete;
    PipeServer& operator=(const PipeServer&) = delete;

    // Bare identifier, as passed to the peer
    const std::wstring& GetName() const { return name_; }

    // Wait for a client; drops any existing connection first
    PipeError Connect(DWORD timeoutMs);

    PipeError Read(void* buffer, DWORD capacity, DWORD timeoutMs, DWORD& bytesRead) override;
    PipeError Write(const void* buffer, DWORD size, DWORD timeoutMs) override;
    bool IsConnected() const override { return context_ != nullptr; }
    void Disconnect() override;

private:
    PipeServer(std::wstring name, SharedHandle pipe);

    std::wstring name_;
    SharedHandle pipe_;
    std::unique_ptr<OverlappedContext> context_;
};

class PipeClient : public MessagePipe {
public:
    // Read/write client in message read mode
    static std::unique_ptr<PipeClient> OpenDuplex(const std::wstring& name, OsError& error);

    // Write-only client (for inbound servers)
    static std::unique_ptr<PipeClient> OpenOutbound(const std::wstring& name, OsError& error);

    PipeClient(const PipeClient&) = delete;
    PipeClient& operator=(const PipeClient&) = delete;

    PipeError Read(void* buffer, DWORD capacity, DWORD timeoutMs, DWORD& bytesRead) override;
    PipeError Write(const void* buffer, DWORD size, DWORD timeoutMs) override;
    bool IsConnected() const override { return context_ != nullptr; }
    void Disconnect() override { context_.reset(); }

private:
    explicit PipeClient(std::unique_ptr<OverlappedContext> context);

    static std::unique_ptr<PipeClient> Open(const std::wstring& name, DWORD desiredAccess,
                                            bool messageMode, OsError& error);

    std::unique_ptr<OverlappedContext> context_;
};

// \\.\pipe\<name>
std::wstring FormatLocalPipePath(const std::wstring& name);

// 32 lowercase hex digits from the system RNG
bool GenerateRandomPipeName(std::wstring& name, OsError& error);

} // namespace bitsagent
