// BitsAgent v1.00 - Worker Entry Point
// BitsAgent_Worker.exe ondemand command-connect <pipe> [debug]

#include "../common/types.h"
#include "../common/config.h"
#include "../common/logger.h"
#include "../common/named_pipe.h"
#include "../common/scoped_handle.h"
#include "bits_service.h"
#include "command_server.h"
#include "job_controller.h"
#include <iostream>
#include <vector>

namespace {

bool IsDebugFlag(const wchar_t* arg) {
    return _wcsicmp(arg, L"debug") == 0 ||
           _wcsicmp(arg, L"-debug") == 0 ||
           _wcsicmp(arg, L"--debug") == 0 ||
           _wcsicmp(arg, L"/debug") == 0;
}

void PrintUsage() {
    std::wcout << L"BitsAgent Worker v" << bitsagent::VERSION << std::endl;
    std::wcout << L"=====================\n" << std::endl;
    std::wcout << L"Usage:" << std::endl;
    std::wcout << L"  BitsAgent_Worker.exe ondemand command-connect <pipe-name> [debug]\n" << std::endl;
    std::wcout << L"Normally launched by the control client or the scheduled task." << std::endl;
}

} // anonymous namespace

int wmain(int argc, wchar_t* argv[]) {
    using namespace bitsagent;

    bool debugMode = false;
    std::vector<std::wstring> args;
    for (int i = 1; i < argc; ++i) {
        if (IsDebugFlag(argv[i])) {
            debugMode = true;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (args.size() != 3 ||
        _wcsicmp(args[0].c_str(), WORKER_ARG_ONDEMAND) != 0 ||
        _wcsicmp(args[1].c_str(), WORKER_ARG_COMMAND_CONNECT) != 0 ||
        !IsValidPipeName(args[2])) {
        PrintUsage();
        return 1;
    }
    const std::wstring& pipeName = args[2];

    const std::wstring baseDir = GetModuleDirectory();
    LightweightLogger& logger = LightweightLogger::Instance();
    if (!logger.Initialize(baseDir, WORKER_LOG_FILENAME)) {
        std::wcerr << L"Warning: log file unavailable in " << baseDir << std::endl;
    }
    logger.SetConsoleOutput(debugMode);

    AgentConfig& config = AgentConfig::Instance();
    if (!config.Initialize(baseDir)) {
        LOG_ALERT(L"Worker: Config unavailable, using defaults");
    }
    logger.SetLogLevel(debugMode ? LogLevel::LOG_DEBUG : config.GetLogLevel());
    logger.SetEnabled(config.IsLogEnabled());

    LOG_INFO(std::wstring(L"Worker: Starting v") + VERSION + L" for pipe " + pipeName);

    ComApartment apartment(COINIT_MULTITHREADED);
    if (!apartment.IsInitialized()) {
        LOG_ERROR(L"Worker: CoInitializeEx failed - " +
                  FormatSystemMessage(static_cast<DWORD>(apartment.GetResult())));
        logger.Shutdown();
        return 1;
    }

    OsError openError;
    std::unique_ptr<PipeClient> control = PipeClient::OpenDuplex(pipeName, openError);
    if (!control) {
        LOG_ERROR(L"Worker: Cannot open control pipe - " + openError.Describe());
        logger.Shutdown();
        return 1;
    }

    JobControllerSettings settings;
    settings.jobName = config.GetJobName();
    settings.savePathPrefix = config.GetSavePathPrefix();
    settings.minimumRetryDelaySec = config.GetMinimumRetryDelay();

    ProtocolError result;
    {
        JobController controller(&BitsTransferService::Connect, settings);
        CommandServer server(*control, controller, config.GetMonitorWriteTimeoutMs());
        result = server.Run();
    }

    LOG_INFO(result ? L"Worker: Exiting after error" : L"Worker: Exiting");
    logger.Shutdown();
    return result ? 1 : 0;
}
