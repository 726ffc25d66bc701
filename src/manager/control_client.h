#pragma once
// BitsAgent v1.00 - Control Client
// The control side owns the pipe: it creates a duplex server, launches the worker with
// the pipe name, and waits for it to connect back. This way the worker is known to be
// ready for commands as soon as the connection arrives.

#include "../common/types.h"
#include "../common/named_pipe.h"
#include "../common/handshake.h"
#include "../common/protocol.h"
#include "../common/codec.h"
#include <functional>
#include <memory>
#include <string>

namespace bitsagent {

// Starts a worker that will connect to pipeName
using WorkerLauncher = std::function<bool(const std::wstring& pipeName, OsError& error)>;

class ControlClient {
public:
    static std::unique_ptr<ControlClient> Create(PipeAccess access, OsError& error);

    ControlClient(const ControlClient&) = delete;
    ControlClient& operator=(const ControlClient&) = delete;

    const std::wstring& GetPipeName() const { return pipe_->GetName(); }
    bool IsConnected() const { return pipe_->IsConnected(); }

    // Launch, wait for the worker to connect, then exchange protocol versions
    ProtocolError Connect(const WorkerLauncher& launcher, DWORD timeoutMs,
                          uint8_t version = BITSAGENT_PROTOCOL_VERSION);

    // One request/response round trip. A protocol error drops the connection.
    template <typename Cmd>
    ProtocolError RunCommand(const Cmd& cmd, DWORD timeoutMs, CommandResult<Cmd>& result);

    void Disconnect() { pipe_->Disconnect(); }

private:
    explicit ControlClient(std::unique_ptr<PipeServer> pipe) : pipe_(std::move(pipe)) {}

    std::unique_ptr<PipeServer> pipe_;
};

template <typename Cmd>
ProtocolError ControlClient::RunCommand(const Cmd& cmd, DWORD timeoutMs, CommandResult<Cmd>& result) {
    std::vector<uint8_t> frame;
    if (!EncodeCommand(Command(cmd), frame)) {
        return ProtocolError::Oversized();
    }

    ProtocolError err = WriteFrame(*pipe_, frame, timeoutMs);
    if (err) {
        return err;
    }

    std::vector<uint8_t> reply;
    err = ReadFrame(*pipe_, BITSAGENT_MAX_RESPONSE, timeoutMs, reply);
    if (err) {
        return err;
    }

    std::optional<CommandResult<Cmd>> decoded = DecodeResult<Cmd>(reply);
    if (!decoded) {
        pipe_->Disconnect();
        return ProtocolError::Undecodable();
    }
    result = std::move(*decoded);
    return ProtocolError::Ok();
}

} // namespace bitsagent
