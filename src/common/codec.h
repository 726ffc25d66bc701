#pragma once
// BitsAgent v1.00 - Protocol Codec
// One frame per pipe message:
//   command  = [Command kind][tag] fields
//   response = [Response kind][tag][success flag] payload
//   status   = [Status kind] snapshot

#include "protocol.h"
#include "wire_format.h"
#include <optional>
#include <vector>

namespace bitsagent {

enum class FrameKind : uint8_t {
    Command = 1,
    Response = 2,
    Status = 3
};

// Returns false when the frame would exceed BITSAGENT_MAX_COMMAND
bool EncodeCommand(const Command& command, std::vector<uint8_t>& frame);
std::optional<Command> DecodeCommand(const std::vector<uint8_t>& frame);

// Returns false when the frame would exceed BITSAGENT_MAX_RESPONSE
bool EncodeStatus(const JobStatus& status, std::vector<uint8_t>& frame);
std::optional<JobStatus> DecodeStatus(const std::vector<uint8_t>& frame);

void WriteFields(BinaryWriter& writer, const StartJobSuccess& success);
bool ReadFields(BinaryReader& reader, StartJobSuccess& success);
void WriteFields(BinaryWriter& writer, const EmptySuccess& success);
bool ReadFields(BinaryReader& reader, EmptySuccess& success);

template <typename KindT>
void WriteFields(BinaryWriter& writer, const CommandFailure<KindT>& failure) {
    writer.WriteU8(static_cast<uint8_t>(failure.kind));
    writer.WriteI32(static_cast<int32_t>(failure.hresult.hr));
    writer.WriteString(failure.hresult.message);
    writer.WriteString(failure.message);
}

template <typename KindT>
bool ReadFields(BinaryReader& reader, CommandFailure<KindT>& failure) {
    uint8_t kind = 0;
    int32_t hr = 0;
    if (!reader.ReadU8(kind) || kind > static_cast<uint8_t>(KindT::Other)) {
        return false;
    }
    failure.kind = static_cast<KindT>(kind);
    if (!reader.ReadI32(hr)) {
        return false;
    }
    failure.hresult.hr = static_cast<HRESULT>(hr);
    return reader.ReadString(failure.hresult.message) && reader.ReadString(failure.message);
}

template <typename Cmd>
bool EncodeResult(const CommandResult<Cmd>& result, std::vector<uint8_t>& frame) {
    BinaryWriter writer(BITSAGENT_MAX_RESPONSE);
    writer.WriteU8(static_cast<uint8_t>(FrameKind::Response));
    writer.WriteU8(static_cast<uint8_t>(Cmd::kTag));

    if (const auto* success = std::get_if<typename Cmd::Success>(&result)) {
        writer.WriteBool(true);
        WriteFields(writer, *success);
    } else {
        writer.WriteBool(false);
        WriteFields(writer, std::get<typename Cmd::Failure>(result));
    }

    if (writer.Overflowed()) {
        return false;
    }
    frame = writer.Take();
    return true;
}

// Fails on a frame for a different command, a truncated frame, or trailing bytes
template <typename Cmd>
std::optional<CommandResult<Cmd>> DecodeResult(const std::vector<uint8_t>& frame) {
    BinaryReader reader(frame);
    uint8_t kind = 0;
    uint8_t tag = 0;
    bool succeeded = false;
    if (!reader.ReadU8(kind) || kind != static_cast<uint8_t>(FrameKind::Response) ||
        !reader.ReadU8(tag) || tag != static_cast<uint8_t>(Cmd::kTag) ||
        !reader.ReadBool(succeeded)) {
        return std::nullopt;
    }

    if (succeeded) {
        typename Cmd::Success success;
        if (!ReadFields(reader, success) || !reader.AtEnd()) {
            return std::nullopt;
        }
        return CommandResult<Cmd>(std::move(success));
    }

    typename Cmd::Failure failure;
    if (!ReadFields(reader, failure) || !reader.AtEnd()) {
        return std::nullopt;
    }
    return CommandResult<Cmd>(std::move(failure));
}

} // namespace bitsagent
