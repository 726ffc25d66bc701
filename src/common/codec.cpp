// BitsAgent v1.00 - Protocol Codec Implementation

#include "codec.h"

namespace bitsagent {

namespace {

void WriteMonitorConfig(BinaryWriter& writer, const MonitorConfig& config) {
    writer.WriteString(config.pipeName);
    writer.WriteU32(config.intervalMillis);
}

bool ReadMonitorConfig(BinaryReader& reader, MonitorConfig& config) {
    return reader.ReadString(config.pipeName) && reader.ReadU32(config.intervalMillis);
}

// ------------------------------------------------------------
// Per-command request bodies
// ------------------------------------------------------------

void WriteBody(BinaryWriter& writer, const StartJobCommand& cmd) {
    writer.WriteString(cmd.url);
    writer.WriteString(cmd.savePath);
    writer.WriteU8(static_cast<uint8_t>(cmd.proxyUsage));
    writer.WriteOptionalTag(cmd.monitor.has_value());
    if (cmd.monitor) {
        WriteMonitorConfig(writer, *cmd.monitor);
    }
}

bool ReadBody(BinaryReader& reader, StartJobCommand& cmd) {
    uint8_t proxy = 0;
    bool hasMonitor = false;
    if (!reader.ReadString(cmd.url) || !reader.ReadString(cmd.savePath) ||
        !reader.ReadU8(proxy) || proxy > static_cast<uint8_t>(ProxyUsage::AutoDetect) ||
        !reader.ReadOptionalTag(hasMonitor)) {
        return false;
    }
    cmd.proxyUsage = static_cast<ProxyUsage>(proxy);
    if (hasMonitor) {
        MonitorConfig config;
        if (!ReadMonitorConfig(reader, config)) {
            return false;
        }
        cmd.monitor = std::move(config);
    }
    return true;
}

void WriteBody(BinaryWriter& writer, const MonitorJobCommand& cmd) {
    writer.WriteGuid(cmd.guid);
    WriteMonitorConfig(writer, cmd.monitor);
}

bool ReadBody(BinaryReader& reader, MonitorJobCommand& cmd) {
    return reader.ReadGuid(cmd.guid) && ReadMonitorConfig(reader, cmd.monitor);
}

void WriteBody(BinaryWriter& writer, const SetJobPriorityCommand& cmd) {
    writer.WriteGuid(cmd.guid);
    writer.WriteBool(cmd.foreground);
}

bool ReadBody(BinaryReader& reader, SetJobPriorityCommand& cmd) {
    return reader.ReadGuid(cmd.guid) && reader.ReadBool(cmd.foreground);
}

void WriteBody(BinaryWriter& writer, const SetUpdateIntervalCommand& cmd) {
    writer.WriteGuid(cmd.guid);
    writer.WriteU32(cmd.intervalMillis);
}

bool ReadBody(BinaryReader& reader, SetUpdateIntervalCommand& cmd) {
    return reader.ReadGuid(cmd.guid) && reader.ReadU32(cmd.intervalMillis);
}

// Suspend, Resume, Complete and Cancel carry only the job id
template <typename Cmd>
void WriteBody(BinaryWriter& writer, const Cmd& cmd) {
    writer.WriteGuid(cmd.guid);
}

template <typename Cmd>
bool ReadBody(BinaryReader& reader, Cmd& cmd) {
    return reader.ReadGuid(cmd.guid);
}

template <typename Cmd>
std::optional<Command> DecodeBody(BinaryReader& reader) {
    Cmd cmd;
    if (!ReadBody(reader, cmd) || !reader.AtEnd()) {
        return std::nullopt;
    }
    return Command(std::move(cmd));
}

} // anonymous namespace

bool EncodeCommand(const Command& command, std::vector<uint8_t>& frame) {
    BinaryWriter writer(BITSAGENT_MAX_COMMAND);
    writer.WriteU8(static_cast<uint8_t>(FrameKind::Command));

    std::visit([&writer](const auto& cmd) {
        using Cmd = std::decay_t<decltype(cmd)>;
        writer.WriteU8(static_cast<uint8_t>(Cmd::kTag));
        WriteBody(writer, cmd);
    }, command);

    if (writer.Overflowed()) {
        return false;
    }
    frame = writer.Take();
    return true;
}

std::optional<Command> DecodeCommand(const std::vector<uint8_t>& frame) {
    BinaryReader reader(frame);
    uint8_t kind = 0;
    uint8_t tag = 0;
    if (!reader.ReadU8(kind) || kind != static_cast<uint8_t>(FrameKind::Command) ||
        !reader.ReadU8(tag)) {
        return std::nullopt;
    }

    switch (static_cast<CommandTag>(tag)) {
        case CommandTag::StartJob:          return DecodeBody<StartJobCommand>(reader);
        case CommandTag::MonitorJob:        return DecodeBody<MonitorJobCommand>(reader);
        case CommandTag::SuspendJob:        return DecodeBody<SuspendJobCommand>(reader);
        case CommandTag::ResumeJob:         return DecodeBody<ResumeJobCommand>(reader);
        case CommandTag::SetJobPriority:    return DecodeBody<SetJobPriorityCommand>(reader);
        case CommandTag::SetUpdateInterval: return DecodeBody<SetUpdateIntervalCommand>(reader);
        case CommandTag::CompleteJob:       return DecodeBody<CompleteJobCommand>(reader);
        case CommandTag::CancelJob:         return DecodeBody<CancelJobCommand>(reader);
    }
    return std::nullopt;
}

// ============================================================
// Result payloads
// ============================================================

void WriteFields(BinaryWriter& writer, const StartJobSuccess& success) {
    writer.WriteGuid(success.guid);
}

bool ReadFields(BinaryReader& reader, StartJobSuccess& success) {
    return reader.ReadGuid(success.guid);
}

void WriteFields(BinaryWriter&, const EmptySuccess&) {
}

bool ReadFields(BinaryReader&, EmptySuccess&) {
    return true;
}

// ============================================================
// Status snapshots
// ============================================================

bool EncodeStatus(const JobStatus& status, std::vector<uint8_t>& frame) {
    BinaryWriter writer(BITSAGENT_MAX_RESPONSE);
    writer.WriteU8(static_cast<uint8_t>(FrameKind::Status));

    writer.WriteU32(static_cast<uint32_t>(status.state));

    writer.WriteOptionalTag(status.progress.totalBytes.has_value());
    if (status.progress.totalBytes) {
        writer.WriteU64(*status.progress.totalBytes);
    }
    writer.WriteU64(status.progress.transferredBytes);
    writer.WriteU32(status.progress.totalFiles);
    writer.WriteU32(status.progress.transferredFiles);

    writer.WriteU32(status.errorCount);

    writer.WriteOptionalTag(status.error.has_value());
    if (status.error) {
        writer.WriteU32(status.error->context);
        writer.WriteString(status.error->contextDescription);
        writer.WriteI32(static_cast<int32_t>(status.error->error.hr));
        writer.WriteString(status.error->error.message);
    }

    writer.WriteU64(status.times.creation);
    writer.WriteU64(status.times.modification);
    writer.WriteOptionalTag(status.times.transferCompletion.has_value());
    if (status.times.transferCompletion) {
        writer.WriteU64(*status.times.transferCompletion);
    }

    writer.WriteOptionalTag(status.url.has_value());
    if (status.url) {
        writer.WriteString(*status.url);
    }

    if (writer.Overflowed()) {
        return false;
    }
    frame = writer.Take();
    return true;
}

std::optional<JobStatus> DecodeStatus(const std::vector<uint8_t>& frame) {
    BinaryReader reader(frame);
    JobStatus status;
    uint8_t kind = 0;
    uint32_t state = 0;
    bool present = false;

    if (!reader.ReadU8(kind) || kind != static_cast<uint8_t>(FrameKind::Status) ||
        !reader.ReadU32(state)) {
        return std::nullopt;
    }
    status.state = static_cast<JobState>(state);

    if (!reader.ReadOptionalTag(present)) return std::nullopt;
    if (present) {
        uint64_t total = 0;
        if (!reader.ReadU64(total)) return std::nullopt;
        status.progress.totalBytes = total;
    }
    if (!reader.ReadU64(status.progress.transferredBytes) ||
        !reader.ReadU32(status.progress.totalFiles) ||
        !reader.ReadU32(status.progress.transferredFiles) ||
        !reader.ReadU32(status.errorCount)) {
        return std::nullopt;
    }

    if (!reader.ReadOptionalTag(present)) return std::nullopt;
    if (present) {
        JobError error;
        int32_t hr = 0;
        if (!reader.ReadU32(error.context) || !reader.ReadString(error.contextDescription) ||
            !reader.ReadI32(hr) || !reader.ReadString(error.error.message)) {
            return std::nullopt;
        }
        error.error.hr = static_cast<HRESULT>(hr);
        status.error = std::move(error);
    }

    if (!reader.ReadU64(status.times.creation) || !reader.ReadU64(status.times.modification)) {
        return std::nullopt;
    }
    if (!reader.ReadOptionalTag(present)) return std::nullopt;
    if (present) {
        uint64_t completion = 0;
        if (!reader.ReadU64(completion)) return std::nullopt;
        status.times.transferCompletion = completion;
    }

    if (!reader.ReadOptionalTag(present)) return std::nullopt;
    if (present) {
        std::wstring url;
        if (!reader.ReadString(url)) return std::nullopt;
        status.url = std::move(url);
    }

    if (!reader.AtEnd()) {
        return std::nullopt;
    }
    return status;
}

} // namespace bitsagent
