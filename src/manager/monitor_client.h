#pragma once
// BitsAgent v1.00 - Monitor Client
// Inbound pipe the worker streams status snapshots into. Pass GetConfig() with a start
// or monitor command, then call GetStatus until the job is final.

#include "../common/types.h"
#include "../common/named_pipe.h"
#include "../common/handshake.h"
#include "../common/protocol.h"
#include <memory>
#include <string>

namespace bitsagent {

class MonitorClient {
public:
    static std::unique_ptr<MonitorClient> Create(PipeAccess access, OsError& error);

    MonitorClient(const MonitorClient&) = delete;
    MonitorClient& operator=(const MonitorClient&) = delete;

    const std::wstring& GetPipeName() const { return pipe_->GetName(); }
    MonitorConfig GetConfig(DWORD intervalMs) const;

    // Waits for the worker's stream on first use. Once the stream drops every later
    // call fails with a not-connected transport error.
    ProtocolError GetStatus(DWORD timeoutMs, JobStatus& status);

private:
    explicit MonitorClient(std::unique_ptr<PipeServer> pipe)
        : pipe_(std::move(pipe))
        , connected_(false) {}

    std::unique_ptr<PipeServer> pipe_;
    bool connected_;
};

} // namespace bitsagent
