// BitsAgent v1.00 - Worker Command Server Implementation

#include "command_server.h"
#include "../common/codec.h"
#include "../common/logger.h"
#include "../common/scoped_handle.h"

namespace bitsagent {

bool IsChannelClosed(const ProtocolError& error) {
    if (error.kind != ProtocolErrorKind::Transport) {
        return false;
    }
    const PipeError& pipe = error.pipe;
    if (pipe.kind == PipeErrorKind::NotConnected) {
        return true;
    }
    return pipe.kind == PipeErrorKind::Api &&
           (pipe.os.code == ERROR_BROKEN_PIPE || pipe.os.code == ERROR_PIPE_NOT_CONNECTED);
}

namespace {

template <typename Cmd>
bool EncodeResponse(const CommandResult<Cmd>& result, std::vector<uint8_t>& frame) {
    if (EncodeResult<Cmd>(result, frame)) {
        return true;
    }
    LOG_ALERT(L"Worker: Response too large, sending a short failure instead");
    using Failure = typename Cmd::Failure;
    CommandResult<Cmd> fallback = Failure::WithMessage(Failure::Kind::Other, L"response too large");
    return EncodeResult<Cmd>(fallback, frame);
}

} // anonymous namespace

CommandServer::CommandServer(MessagePipe& control, JobController& controller,
                             DWORD monitorWriteTimeoutMs)
    : control_(control)
    , controller_(controller)
    , monitorWriteTimeoutMs_(monitorWriteTimeoutMs) {
}

CommandServer::~CommandServer() {
    Shutdown();
}

ProtocolError CommandServer::Run() {
    ProtocolError err = HandshakeAsResponder(control_, BITSAGENT_CONTROL_TIMEOUT_MS);
    if (err) {
        Shutdown();
        return err;
    }
    LOG_INFO(L"Worker: Handshake complete, protocol version " +
             std::to_wstring(BITSAGENT_PROTOCOL_VERSION));

    for (;;) {
        std::vector<uint8_t> request;
        err = ReadFrame(control_, BITSAGENT_MAX_COMMAND, INFINITE, request);
        if (err) {
            if (IsChannelClosed(err)) {
                LOG_INFO(L"Worker: Control channel closed");
                err = ProtocolError::Ok();
            }
            break;
        }

        std::optional<Command> command = DecodeCommand(request);
        if (!command) {
            err = ProtocolError::Undecodable();
            control_.Disconnect();
            break;
        }

        std::vector<uint8_t> response;
        if (!Dispatch(*command, response)) {
            err = ProtocolError::Oversized();
            control_.Disconnect();
            break;
        }

        err = WriteFrame(control_, response, BITSAGENT_CONTROL_TIMEOUT_MS);
        if (err) {
            break;
        }
    }

    if (err) {
        LOG_ERROR(L"Worker: " + err.Describe());
    }
    Shutdown();
    return err;
}

bool CommandServer::Dispatch(const Command& command, std::vector<uint8_t>& response) {
    return std::visit([this, &response](const auto& cmd) {
        using Cmd = std::decay_t<decltype(cmd)>;
        return EncodeResponse<Cmd>(Execute(cmd), response);
    }, command);
}

// ============================================================
// Commands
// ============================================================

CommandResult<StartJobCommand> CommandServer::Execute(const StartJobCommand& cmd) {
    std::unique_ptr<JobMonitor> monitor;
    CommandResult<StartJobCommand> result = controller_.StartJob(cmd, monitor);
    if (monitor) {
        StartStreaming(std::move(monitor), cmd.monitor->pipeName);
    }
    return result;
}

CommandResult<MonitorJobCommand> CommandServer::Execute(const MonitorJobCommand& cmd) {
    std::unique_ptr<JobMonitor> monitor;
    CommandResult<MonitorJobCommand> result = controller_.MonitorJob(cmd, monitor);
    if (monitor) {
        StartStreaming(std::move(monitor), cmd.monitor.pipeName);
    }
    return result;
}

CommandResult<SuspendJobCommand> CommandServer::Execute(const SuspendJobCommand& cmd) {
    return controller_.SuspendJob(cmd);
}

CommandResult<ResumeJobCommand> CommandServer::Execute(const ResumeJobCommand& cmd) {
    return controller_.ResumeJob(cmd);
}

CommandResult<SetJobPriorityCommand> CommandServer::Execute(const SetJobPriorityCommand& cmd) {
    return controller_.SetJobPriority(cmd);
}

CommandResult<SetUpdateIntervalCommand> CommandServer::Execute(const SetUpdateIntervalCommand& cmd) {
    return controller_.SetUpdateInterval(cmd);
}

CommandResult<CompleteJobCommand> CommandServer::Execute(const CompleteJobCommand& cmd) {
    return controller_.CompleteJob(cmd);
}

CommandResult<CancelJobCommand> CommandServer::Execute(const CancelJobCommand& cmd) {
    return controller_.CancelJob(cmd);
}

// ============================================================
// Status streaming
// ============================================================

void CommandServer::StartStreaming(std::unique_ptr<JobMonitor> monitor, const std::wstring& pipeName) {
    ReapFinishedStreams();

    Stream stream;
    stream.done = std::make_shared<std::atomic<bool>>(false);
    stream.thread = std::thread(
        [monitor = std::move(monitor), pipeName, timeout = monitorWriteTimeoutMs_,
         done = stream.done]() mutable {
            StreamStatus(std::move(monitor), std::move(pipeName), timeout);
            done->store(true);
        });
    streams_.push_back(std::move(stream));
}

void CommandServer::ReapFinishedStreams() {
    auto it = streams_.begin();
    while (it != streams_.end()) {
        if (it->done->load()) {
            it->thread.join();
            it = streams_.erase(it);
        } else {
            ++it;
        }
    }
}

void CommandServer::StreamStatus(std::unique_ptr<JobMonitor> monitor, std::wstring pipeName,
                                 DWORD writeTimeoutMs) {
    ComApartment apartment;
    if (!apartment.IsInitialized()) {
        LOG_ERROR(L"Stream: CoInitializeEx failed");
        monitor->Stop();
        return;
    }

    const std::wstring job = FormatGuid(monitor->GetJobId());
    OsError openError;
    std::unique_ptr<PipeClient> pipe = PipeClient::OpenOutbound(pipeName, openError);
    if (!pipe) {
        LOG_ERROR(L"Stream: Cannot open monitor pipe for " + job + L" - " + openError.Describe());
        monitor->Stop();
        return;
    }
    LOG_DEBUG(L"Stream: Started for " + job);

    for (;;) {
        JobStatus status;
        MonitorResult result = monitor->GetStatus(INFINITE, status);
        if (result) {
            LOG_DEBUG(L"Stream: Ending for " + job + L" - " + result.Describe());
            break;
        }

        std::vector<uint8_t> frame;
        if (!EncodeStatus(status, frame)) {
            LOG_ERROR(L"Stream: Status for " + job + L" exceeds frame limit");
            break;
        }

        ProtocolError err = WriteFrame(*pipe, frame, writeTimeoutMs);
        if (err) {
            LOG_INFO(L"Stream: Watcher gone for " + job + L" - " + err.Describe());
            break;
        }
    }

    monitor->Stop();
}

void CommandServer::Shutdown() {
    controller_.StopAllMonitors();
    for (Stream& stream : streams_) {
        if (stream.thread.joinable()) {
            stream.thread.join();
        }
    }
    streams_.clear();
}

} // namespace bitsagent
