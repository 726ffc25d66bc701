// BitsAgent v1.00 - Monitor Client Implementation

#include "monitor_client.h"
#include "../common/codec.h"
#include "../common/logger.h"
#include <chrono>

namespace bitsagent {

std::unique_ptr<MonitorClient> MonitorClient::Create(PipeAccess access, OsError& error) {
    std::unique_ptr<PipeServer> pipe = PipeServer::Create(PipeDirection::Inbound, access, error);
    if (!pipe) {
        LOG_ERROR(L"Monitor: Cannot create pipe - " + error.Describe());
        return nullptr;
    }
    return std::unique_ptr<MonitorClient>(new MonitorClient(std::move(pipe)));
}

MonitorConfig MonitorClient::GetConfig(DWORD intervalMs) const {
    MonitorConfig config;
    config.pipeName = pipe_->GetName();
    config.intervalMillis = intervalMs;
    return config;
}

ProtocolError MonitorClient::GetStatus(DWORD timeoutMs, JobStatus& status) {
    DWORD readTimeout = timeoutMs;

    if (!connected_) {
        auto started = std::chrono::steady_clock::now();
        PipeError err = pipe_->Connect(timeoutMs);
        if (err) {
            return ProtocolError::Transport(err);
        }
        connected_ = true;

        // The connect wait counts against this call's timeout
        if (timeoutMs != INFINITE) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            readTimeout = (static_cast<DWORD>(elapsed) >= timeoutMs)
                ? 0
                : timeoutMs - static_cast<DWORD>(elapsed);
        }
    }

    std::vector<uint8_t> frame;
    ProtocolError err = ReadFrame(*pipe_, BITSAGENT_MAX_RESPONSE, readTimeout, frame);
    if (err) {
        return err;
    }

    std::optional<JobStatus> decoded = DecodeStatus(frame);
    if (!decoded) {
        pipe_->Disconnect();
        return ProtocolError::Undecodable();
    }
    status = std::move(*decoded);
    return ProtocolError::Ok();
}

} // namespace bitsagent
