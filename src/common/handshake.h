#pragma once
// BitsAgent v1.00 - Protocol Handshake and Framing
// Each side sends one version byte and reads the peer's. Any mismatch drops the connection.

#include "types.h"
#include "named_pipe.h"
#include <string>
#include <vector>

namespace bitsagent {

enum class ProtocolErrorKind : uint8_t {
    None = 0,
    Transport,          // see pipe
    VersionMismatch,
    BadVersionLength,   // peer's version message was not exactly one byte
    Oversized,          // frame would exceed the size limit
    Undecodable
};

struct ProtocolError {
    ProtocolErrorKind kind = ProtocolErrorKind::None;
    PipeError pipe;
    uint8_t localVersion = 0;
    uint8_t peerVersion = 0;
    DWORD length = 0;

    bool IsError() const { return kind != ProtocolErrorKind::None; }
    explicit operator bool() const { return IsError(); }

    static ProtocolError Ok() { return ProtocolError(); }
    static ProtocolError Transport(const PipeError& error) {
        ProtocolError e = Make(ProtocolErrorKind::Transport);
        e.pipe = error;
        return e;
    }
    static ProtocolError VersionMismatch(uint8_t local, uint8_t peer) {
        ProtocolError e = Make(ProtocolErrorKind::VersionMismatch);
        e.localVersion = local;
        e.peerVersion = peer;
        return e;
    }
    static ProtocolError BadVersionLength(DWORD received) {
        ProtocolError e = Make(ProtocolErrorKind::BadVersionLength);
        e.length = received;
        return e;
    }
    static ProtocolError Oversized() { return Make(ProtocolErrorKind::Oversized); }
    static ProtocolError Undecodable() { return Make(ProtocolErrorKind::Undecodable); }

    std::wstring Describe() const;

private:
    static ProtocolError Make(ProtocolErrorKind k) {
        ProtocolError e;
        e.kind = k;
        return e;
    }
};

// Control side: write our version, then read the peer's
ProtocolError HandshakeAsInitiator(MessagePipe& pipe, DWORD timeoutMs,
                                   uint8_t version = BITSAGENT_PROTOCOL_VERSION);

// Worker side: read the peer's version, then write ours
ProtocolError HandshakeAsResponder(MessagePipe& pipe, DWORD timeoutMs,
                                   uint8_t version = BITSAGENT_PROTOCOL_VERSION);

// One encoded frame per message. A message larger than limit is Oversized.
ProtocolError ReadFrame(MessagePipe& pipe, size_t limit, DWORD timeoutMs,
                        std::vector<uint8_t>& frame);
ProtocolError WriteFrame(MessagePipe& pipe, const std::vector<uint8_t>& frame, DWORD timeoutMs);

} // namespace bitsagent
