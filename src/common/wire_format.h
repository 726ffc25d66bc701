#pragma once
// BitsAgent v1.00 - Binary Wire Format
// Little-endian values, each preceded by a one-byte type tag so that a
// mismatched or truncated frame is detected instead of misread.

#include "types.h"
#include <string>
#include <vector>

namespace bitsagent {

enum class WireType : uint8_t {
    U8 = 0x01,
    Bool = 0x02,
    U32 = 0x03,
    I32 = 0x04,
    U64 = 0x05,
    String = 0x06,     // u32 byte length + UTF-8
    Guid = 0x07,       // 16 raw bytes
    None = 0x08,       // absent optional
    Some = 0x09        // present optional, value follows
};

// Appends to a buffer capped at limit bytes. Once the cap is hit every further
// write is dropped and Overflowed() stays true.
class BinaryWriter {
public:
    explicit BinaryWriter(size_t limit);

    void WriteU8(uint8_t value);
    void WriteBool(bool value);
    void WriteU32(uint32_t value);
    void WriteI32(int32_t value);
    void WriteU64(uint64_t value);
    void WriteString(const std::wstring& value);
    void WriteGuid(const GUID& value);
    void WriteOptionalTag(bool present);

    bool Overflowed() const { return overflowed_; }
    const std::vector<uint8_t>& Data() const { return data_; }
    std::vector<uint8_t> Take() { return std::move(data_); }

private:
    void Append(const void* bytes, size_t size);
    void AppendTag(WireType type);
    void AppendRawU32(uint32_t value);

    std::vector<uint8_t> data_;
    size_t limit_;
    bool overflowed_;
};

// Reads tagged values. Any mismatch makes the reader fail permanently.
class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t size);
    explicit BinaryReader(const std::vector<uint8_t>& data);

    bool ReadU8(uint8_t& value);
    bool ReadBool(bool& value);
    bool ReadU32(uint32_t& value);
    bool ReadI32(int32_t& value);
    bool ReadU64(uint64_t& value);
    bool ReadString(std::wstring& value);
    bool ReadGuid(GUID& value);
    bool ReadOptionalTag(bool& present);

    bool Failed() const { return failed_; }
    bool AtEnd() const { return !failed_ && pos_ == size_; }
    size_t Remaining() const { return size_ - pos_; }

private:
    bool ExpectTag(WireType type);
    bool Take(void* out, size_t size);
    bool TakeRawU32(uint32_t& value);
    bool Fail();

    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    bool failed_;
};

} // namespace bitsagent
