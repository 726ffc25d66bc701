// BitsAgent v1.00 - Control Client Implementation

#include "control_client.h"
#include "../common/logger.h"

namespace bitsagent {

std::unique_ptr<ControlClient> ControlClient::Create(PipeAccess access, OsError& error) {
    std::unique_ptr<PipeServer> pipe = PipeServer::Create(PipeDirection::Duplex, access, error);
    if (!pipe) {
        LOG_ERROR(L"Control: Cannot create pipe - " + error.Describe());
        return nullptr;
    }
    return std::unique_ptr<ControlClient>(new ControlClient(std::move(pipe)));
}

ProtocolError ControlClient::Connect(const WorkerLauncher& launcher, DWORD timeoutMs,
                                     uint8_t version) {
    OsError launchError;
    if (!launcher(pipe_->GetName(), launchError)) {
        LOG_ERROR(L"Control: Worker launch failed - " + launchError.Describe());
        return ProtocolError::Transport(PipeError::Api(launchError));
    }

    PipeError err = pipe_->Connect(timeoutMs);
    if (err) {
        LOG_ERROR(L"Control: Worker did not connect - " + err.Describe());
        return ProtocolError::Transport(err);
    }

    ProtocolError result = HandshakeAsInitiator(*pipe_, timeoutMs, version);
    if (!result) {
        LOG_DEBUG(L"Control: Connected to worker on " + pipe_->GetName());
    }
    return result;
}

} // namespace bitsagent
