// BitsAgent v1.00 - Protocol Handshake and Framing Implementation

#include "handshake.h"
#include "logger.h"

namespace bitsagent {

std::wstring ProtocolError::Describe() const {
    switch (kind) {
        case ProtocolErrorKind::None:
            return L"no error";
        case ProtocolErrorKind::Transport:
            return L"transport: " + pipe.Describe();
        case ProtocolErrorKind::VersionMismatch:
            return L"protocol version mismatch (local " + std::to_wstring(localVersion) +
                   L", peer " + std::to_wstring(peerVersion) + L")";
        case ProtocolErrorKind::BadVersionLength:
            return L"version message has " + std::to_wstring(length) + L" bytes, expected 1";
        case ProtocolErrorKind::Oversized:
            return L"frame exceeds size limit";
        case ProtocolErrorKind::Undecodable:
            return L"undecodable frame";
    }
    return L"unknown protocol error";
}

namespace {

ProtocolError SendVersion(MessagePipe& pipe, DWORD timeoutMs, uint8_t version) {
    PipeError err = pipe.Write(&version, 1, timeoutMs);
    if (err) {
        return ProtocolError::Transport(err);
    }
    return ProtocolError::Ok();
}

ProtocolError ReceiveVersion(MessagePipe& pipe, DWORD timeoutMs, uint8_t version) {
    // Room for more than one byte so an over-long reply is seen as such
    uint8_t buffer[8] = {};
    DWORD bytesRead = 0;
    PipeError err = pipe.Read(buffer, sizeof(buffer), timeoutMs, bytesRead);
    if (err) {
        if (err.kind == PipeErrorKind::Api && err.os.code == ERROR_MORE_DATA) {
            // Only the buffer's worth of the message is known
            return ProtocolError::BadVersionLength(static_cast<DWORD>(sizeof(buffer)));
        }
        return ProtocolError::Transport(err);
    }
    if (bytesRead != 1) {
        return ProtocolError::BadVersionLength(bytesRead);
    }
    if (buffer[0] != version) {
        return ProtocolError::VersionMismatch(version, buffer[0]);
    }
    return ProtocolError::Ok();
}

ProtocolError Finish(MessagePipe& pipe, ProtocolError result) {
    if (result) {
        LOG_ERROR(L"Handshake: " + result.Describe());
        pipe.Disconnect();
    }
    return result;
}

} // anonymous namespace

ProtocolError HandshakeAsInitiator(MessagePipe& pipe, DWORD timeoutMs, uint8_t version) {
    ProtocolError result = SendVersion(pipe, timeoutMs, version);
    if (!result) {
        result = ReceiveVersion(pipe, timeoutMs, version);
    }
    return Finish(pipe, result);
}

ProtocolError HandshakeAsResponder(MessagePipe& pipe, DWORD timeoutMs, uint8_t version) {
    ProtocolError result = ReceiveVersion(pipe, timeoutMs, version);
    // Answer a mismatch too, so the initiator reports it instead of a broken pipe
    if (!result || result.kind == ProtocolErrorKind::VersionMismatch) {
        ProtocolError sent = SendVersion(pipe, timeoutMs, version);
        if (!result) {
            result = sent;
        }
    }
    return Finish(pipe, result);
}

// ============================================================
// Framing
// ============================================================

ProtocolError ReadFrame(MessagePipe& pipe, size_t limit, DWORD timeoutMs,
                        std::vector<uint8_t>& frame) {
    PipeError err = pipe.ReadMessage(frame, limit, timeoutMs);
    if (err) {
        if (err.kind == PipeErrorKind::Api && err.os.code == ERROR_MORE_DATA) {
            return ProtocolError::Oversized();
        }
        return ProtocolError::Transport(err);
    }
    return ProtocolError::Ok();
}

ProtocolError WriteFrame(MessagePipe& pipe, const std::vector<uint8_t>& frame, DWORD timeoutMs) {
    PipeError err = pipe.WriteMessage(frame, timeoutMs);
    if (err) {
        return ProtocolError::Transport(err);
    }
    return ProtocolError::Ok();
}

} // namespace bitsagent
