// BitsAgent v1.00 - Control Client Entry Point
// Command line test client: launches the worker and runs one command against it

#include "../common/types.h"
#include "../common/config.h"
#include "../common/logger.h"
#include "../common/guid.h"
#include "../common/scoped_handle.h"
#include "control_client.h"
#include "monitor_client.h"
#include <iostream>
#include <vector>

namespace {

using namespace bitsagent;

constexpr DWORD WORKER_EXIT_WAIT_MS = 10000;

void PrintUsage() {
    std::wcout << L"BitsAgent Client v" << VERSION << std::endl;
    std::wcout << L"=====================\n" << std::endl;
    std::wcout << L"Usage:" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe start <url> <file>   - Start a download and watch it" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe monitor <guid>       - Watch an existing job" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe suspend <guid>" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe resume <guid>" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe fg <guid>            - Foreground priority" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe bg <guid>            - Normal priority" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe complete <guid>" << std::endl;
    std::wcout << L"  BitsAgent_Client.exe cancel <guid>\n" << std::endl;
    std::wcout << L"Add 'debug' to log to the console." << std::endl;
}

bool LaunchWorker(const std::wstring& pipeName, bool debugMode, ScopedHandle& process,
                  OsError& error) {
    std::wstring exe = GetModuleDirectory() + L"\\" + WORKER_EXE_FILENAME;
    std::wstring cmdLine = L"\"" + exe + L"\" " + WORKER_ARG_ONDEMAND + L" " +
                           WORKER_ARG_COMMAND_CONNECT + L" " + pipeName;
    if (debugMode) {
        cmdLine += L" debug";
    }

    STARTUPINFOW si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessW(exe.c_str(), &cmdLine[0], nullptr, nullptr, FALSE,
                        debugMode ? 0 : CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        error = OsError::FromLastError(L"CreateProcessW");
        return false;
    }

    CloseHandle(pi.hThread);
    process = MakeScopedHandle(pi.hProcess);
    LOG_DEBUG(L"Client: Worker started (pid " + std::to_wstring(pi.dwProcessId) + L")");
    return true;
}

template <typename Cmd>
bool ReportResult(const ProtocolError& err, const CommandResult<Cmd>& result, const wchar_t* name) {
    if (err) {
        std::wcerr << name << L": " << err.Describe() << std::endl;
        return false;
    }
    if (const auto* failure = std::get_if<typename Cmd::Failure>(&result)) {
        std::wcerr << name << L" failed: " << failure->Describe() << std::endl;
        return false;
    }
    return true;
}

int WatchStatus(MonitorClient& monitor, DWORD intervalMs) {
    // Generous per-snapshot timeout; the worker normally reports every interval
    const DWORD timeoutMs = (intervalMs > INFINITE / 10) ? INFINITE : intervalMs * 10;

    for (;;) {
        JobStatus status;
        ProtocolError err = monitor.GetStatus(timeoutMs, status);
        if (err) {
            std::wcerr << L"monitor: " << err.Describe() << std::endl;
            return 1;
        }

        std::wcout << DescribeStatus(status) << std::endl;
        if (IsFinalJobState(status.state)) {
            std::wcout << L"monitor ending" << std::endl;
            return 0;
        }
    }
}

int RunStart(ControlClient& control, MonitorClient& monitor, const std::wstring& url,
             const std::wstring& file, DWORD intervalMs) {
    StartJobCommand cmd;
    cmd.url = url;
    cmd.savePath = file;
    cmd.monitor = monitor.GetConfig(intervalMs);

    CommandResult<StartJobCommand> result;
    ProtocolError err = control.RunCommand(cmd, BITSAGENT_CONTROL_TIMEOUT_MS, result);
    if (!ReportResult<StartJobCommand>(err, result, L"start")) {
        return 1;
    }

    std::wcout << L"start success, guid = " << FormatGuid(std::get<StartJobSuccess>(result).guid)
               << std::endl;
    return WatchStatus(monitor, intervalMs);
}

int RunMonitor(ControlClient& control, MonitorClient& monitor, const JobId& guid, DWORD intervalMs) {
    MonitorJobCommand cmd;
    cmd.guid = guid;
    cmd.monitor = monitor.GetConfig(intervalMs);

    CommandResult<MonitorJobCommand> result;
    ProtocolError err = control.RunCommand(cmd, BITSAGENT_CONTROL_TIMEOUT_MS, result);
    if (!ReportResult<MonitorJobCommand>(err, result, L"monitor")) {
        return 1;
    }

    std::wcout << L"monitor success" << std::endl;
    return WatchStatus(monitor, intervalMs);
}

template <typename Cmd>
int RunSimple(ControlClient& control, Cmd cmd, const wchar_t* name) {
    CommandResult<Cmd> result;
    ProtocolError err = control.RunCommand(cmd, BITSAGENT_CONTROL_TIMEOUT_MS, result);
    if (!ReportResult<Cmd>(err, result, name)) {
        return 1;
    }
    std::wcout << name << L" success" << std::endl;
    return 0;
}

int RunJobCommand(ControlClient& control, const std::wstring& command, const JobId& guid) {
    if (command == L"suspend") {
        SuspendJobCommand cmd;
        cmd.guid = guid;
        return RunSimple(control, cmd, L"suspend");
    }
    if (command == L"resume") {
        ResumeJobCommand cmd;
        cmd.guid = guid;
        return RunSimple(control, cmd, L"resume");
    }
    if (command == L"fg" || command == L"bg") {
        SetJobPriorityCommand cmd;
        cmd.guid = guid;
        cmd.foreground = (command == L"fg");
        return RunSimple(control, cmd, command.c_str());
    }
    if (command == L"complete") {
        CompleteJobCommand cmd;
        cmd.guid = guid;
        return RunSimple(control, cmd, L"complete");
    }
    CancelJobCommand cmd;
    cmd.guid = guid;
    return RunSimple(control, cmd, L"cancel");
}

bool IsJobCommand(const std::wstring& command) {
    return command == L"suspend" || command == L"resume" || command == L"fg" ||
           command == L"bg" || command == L"complete" || command == L"cancel";
}

} // anonymous namespace

int wmain(int argc, wchar_t* argv[]) {
    bool debugMode = false;
    std::vector<std::wstring> args;
    for (int i = 1; i < argc; ++i) {
        if (_wcsicmp(argv[i], L"debug") == 0) {
            debugMode = true;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    const std::wstring command = ToLower(args[0]);
    const bool isStart = (command == L"start" && args.size() == 3);
    const bool isMonitor = (command == L"monitor" && args.size() == 2);
    const bool isJob = (IsJobCommand(command) && args.size() == 2);
    if (!isStart && !isMonitor && !isJob) {
        PrintUsage();
        return 1;
    }

    JobId guid{};
    if (!isStart) {
        std::optional<JobId> parsed = ParseGuid(args[1]);
        if (!parsed) {
            std::wcerr << L"Invalid job id: " << args[1] << std::endl;
            return 1;
        }
        guid = *parsed;
    }

    const std::wstring baseDir = GetModuleDirectory();
    LightweightLogger& logger = LightweightLogger::Instance();
    if (!logger.Initialize(baseDir, CLIENT_LOG_FILENAME)) {
        std::wcerr << L"Warning: log file unavailable in " << baseDir << std::endl;
    }
    logger.SetConsoleOutput(debugMode);

    AgentConfig& config = AgentConfig::Instance();
    if (!config.Initialize(baseDir)) {
        LOG_ALERT(L"Client: Config unavailable, using defaults");
    }
    logger.SetLogLevel(debugMode ? LogLevel::LOG_DEBUG : config.GetLogLevel());
    logger.SetEnabled(config.IsLogEnabled());

    const PipeAccess access = config.IsLocalServiceOnly() ? PipeAccess::LocalService : PipeAccess::Default;
    const DWORD intervalMs = config.GetMonitorIntervalMs();

    OsError error;
    std::unique_ptr<ControlClient> control = ControlClient::Create(access, error);
    if (!control) {
        std::wcerr << L"Cannot create control pipe: " << error.Describe() << std::endl;
        return 1;
    }

    std::unique_ptr<MonitorClient> monitor;
    if (isStart || isMonitor) {
        monitor = MonitorClient::Create(access, error);
        if (!monitor) {
            std::wcerr << L"Cannot create monitor pipe: " << error.Describe() << std::endl;
            return 1;
        }
    }

    ScopedHandle worker;
    WorkerLauncher launcher = [debugMode, &worker](const std::wstring& pipeName, OsError& launchError) {
        return LaunchWorker(pipeName, debugMode, worker, launchError);
    };

    ProtocolError connectError = control->Connect(launcher, BITSAGENT_CONTROL_TIMEOUT_MS);
    if (connectError) {
        std::wcerr << L"Cannot connect to worker: " << connectError.Describe() << std::endl;
        return 1;
    }

    int exitCode = 0;
    if (isStart) {
        exitCode = RunStart(*control, *monitor, args[1], args[2], intervalMs);
    } else if (isMonitor) {
        exitCode = RunMonitor(*control, *monitor, guid, intervalMs);
    } else {
        exitCode = RunJobCommand(*control, command, guid);
    }

    // Closing the control channel tells the worker to stop its monitors and exit
    control->Disconnect();
    if (worker && WaitForSingleObject(worker.get(), WORKER_EXIT_WAIT_MS) != WAIT_OBJECT_0) {
        LOG_ALERT(L"Client: Worker did not exit in time");
    }

    logger.Shutdown();
    return exitCode;
}
