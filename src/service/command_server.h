#pragma once
// BitsAgent v1.00 - Worker Command Server
// Serves one control connection: handshake, then strict request/response until the
// channel closes. Each monitor gets its own streaming thread writing status snapshots
// to the watcher's inbound pipe.

#include "../common/types.h"
#include "../common/named_pipe.h"
#include "../common/handshake.h"
#include "../common/protocol.h"
#include "job_controller.h"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

class CommandServerTest;

namespace bitsagent {

class CommandServer {
    friend class ::CommandServerTest;

public:
    CommandServer(MessagePipe& control, JobController& controller, DWORD monitorWriteTimeoutMs);
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    // Returns Ok when the control side closed the channel normally.
    // All monitors are stopped and their threads joined before returning.
    ProtocolError Run();

private:
    // Encodes the response; false only if even the fallback failure does not fit
    bool Dispatch(const Command& command, std::vector<uint8_t>& response);

    CommandResult<StartJobCommand> Execute(const StartJobCommand& cmd);
    CommandResult<MonitorJobCommand> Execute(const MonitorJobCommand& cmd);
    CommandResult<SuspendJobCommand> Execute(const SuspendJobCommand& cmd);
    CommandResult<ResumeJobCommand> Execute(const ResumeJobCommand& cmd);
    CommandResult<SetJobPriorityCommand> Execute(const SetJobPriorityCommand& cmd);
    CommandResult<SetUpdateIntervalCommand> Execute(const SetUpdateIntervalCommand& cmd);
    CommandResult<CompleteJobCommand> Execute(const CompleteJobCommand& cmd);
    CommandResult<CancelJobCommand> Execute(const CancelJobCommand& cmd);

    struct Stream {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;    // set by the thread as its last step
    };

    void StartStreaming(std::unique_ptr<JobMonitor> monitor, const std::wstring& pipeName);
    static void StreamStatus(std::unique_ptr<JobMonitor> monitor, std::wstring pipeName,
                             DWORD writeTimeoutMs);

    // Joins streams whose watcher or job has gone away
    void ReapFinishedStreams();

    void Shutdown();

    MessagePipe& control_;
    JobController& controller_;
    DWORD monitorWriteTimeoutMs_;
    std::vector<Stream> streams_;
};

// A read error that just means the peer went away
bool IsChannelClosed(const ProtocolError& error);

} // namespace bitsagent
