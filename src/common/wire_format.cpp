// BitsAgent v1.00 - Binary Wire Format Implementation

#include "wire_format.h"
#include <cstring>

namespace bitsagent {

namespace {
// Strict decode: malformed UTF-8 fails rather than turning into U+FFFD
bool DecodeUtf8(const char* bytes, size_t size, std::wstring& out) {
    out.clear();
    if (size == 0) {
        return true;
    }
    int len = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, bytes,
                                  static_cast<int>(size), nullptr, 0);
    if (len <= 0) {
        return false;
    }
    out.resize(static_cast<size_t>(len));
    return MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, bytes,
                               static_cast<int>(size), &out[0], len) == len;
}
} // anonymous namespace

// ============================================================
// BinaryWriter
// ============================================================

BinaryWriter::BinaryWriter(size_t limit)
    : limit_(limit)
    , overflowed_(false) {
}

void BinaryWriter::Append(const void* bytes, size_t size) {
    if (overflowed_) return;
    if (data_.size() + size > limit_) {
        overflowed_ = true;
        return;
    }
    const uint8_t* p = static_cast<const uint8_t*>(bytes);
    data_.insert(data_.end(), p, p + size);
}

void BinaryWriter::AppendTag(WireType type) {
    uint8_t tag = static_cast<uint8_t>(type);
    Append(&tag, 1);
}

void BinaryWriter::AppendRawU32(uint32_t value) {
    uint8_t bytes[4];
    for (int i = 0; i < 4; ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    Append(bytes, sizeof(bytes));
}

void BinaryWriter::WriteU8(uint8_t value) {
    AppendTag(WireType::U8);
    Append(&value, 1);
}

void BinaryWriter::WriteBool(bool value) {
    AppendTag(WireType::Bool);
    uint8_t b = value ? 1 : 0;
    Append(&b, 1);
}

void BinaryWriter::WriteU32(uint32_t value) {
    AppendTag(WireType::U32);
    AppendRawU32(value);
}

void BinaryWriter::WriteI32(int32_t value) {
    AppendTag(WireType::I32);
    AppendRawU32(static_cast<uint32_t>(value));
}

void BinaryWriter::WriteU64(uint64_t value) {
    AppendTag(WireType::U64);
    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    Append(bytes, sizeof(bytes));
}

void BinaryWriter::WriteString(const std::wstring& value) {
    std::string utf8 = WideToUtf8(value);
    AppendTag(WireType::String);
    AppendRawU32(static_cast<uint32_t>(utf8.size()));
    Append(utf8.data(), utf8.size());
}

void BinaryWriter::WriteGuid(const GUID& value) {
    AppendTag(WireType::Guid);
    Append(&value, sizeof(GUID));
}

void BinaryWriter::WriteOptionalTag(bool present) {
    AppendTag(present ? WireType::Some : WireType::None);
}

// ============================================================
// BinaryReader
// ============================================================

BinaryReader::BinaryReader(const uint8_t* data, size_t size)
    : data_(data)
    , size_(size)
    , pos_(0)
    , failed_(false) {
}

BinaryReader::BinaryReader(const std::vector<uint8_t>& data)
    : BinaryReader(data.data(), data.size()) {
}

bool BinaryReader::Fail() {
    failed_ = true;
    return false;
}

bool BinaryReader::Take(void* out, size_t size) {
    if (failed_) return false;
    if (size > size_ - pos_) {
        return Fail();
    }
    if (size > 0) {
        std::memcpy(out, data_ + pos_, size);
    }
    pos_ += size;
    return true;
}

bool BinaryReader::TakeRawU32(uint32_t& value) {
    uint8_t bytes[4];
    if (!Take(bytes, sizeof(bytes))) return false;
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(bytes[i]) << (8 * i);
    }
    return true;
}

bool BinaryReader::ExpectTag(WireType type) {
    uint8_t tag = 0;
    if (!Take(&tag, 1)) return false;
    if (tag != static_cast<uint8_t>(type)) {
        return Fail();
    }
    return true;
}

bool BinaryReader::ReadU8(uint8_t& value) {
    return ExpectTag(WireType::U8) && Take(&value, 1);
}

bool BinaryReader::ReadBool(bool& value) {
    uint8_t b = 0;
    if (!ExpectTag(WireType::Bool) || !Take(&b, 1)) return false;
    if (b > 1) {
        return Fail();
    }
    value = (b == 1);
    return true;
}

bool BinaryReader::ReadU32(uint32_t& value) {
    return ExpectTag(WireType::U32) && TakeRawU32(value);
}

bool BinaryReader::ReadI32(int32_t& value) {
    uint32_t raw = 0;
    if (!ExpectTag(WireType::I32) || !TakeRawU32(raw)) return false;
    value = static_cast<int32_t>(raw);
    return true;
}

bool BinaryReader::ReadU64(uint64_t& value) {
    uint8_t bytes[8];
    if (!ExpectTag(WireType::U64) || !Take(bytes, sizeof(bytes))) return false;
    value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
    }
    return true;
}

bool BinaryReader::ReadString(std::wstring& value) {
    uint32_t length = 0;
    if (!ExpectTag(WireType::String) || !TakeRawU32(length)) return false;
    if (length > Remaining()) {
        return Fail();
    }
    const char* bytes = reinterpret_cast<const char*>(data_ + pos_);
    if (!DecodeUtf8(bytes, length, value)) {
        return Fail();
    }
    pos_ += length;
    return true;
}

bool BinaryReader::ReadGuid(GUID& value) {
    return ExpectTag(WireType::Guid) && Take(&value, sizeof(GUID));
}

bool BinaryReader::ReadOptionalTag(bool& present) {
    uint8_t tag = 0;
    if (!Take(&tag, 1)) return false;
    if (tag == static_cast<uint8_t>(WireType::Some)) {
        present = true;
        return true;
    }
    if (tag == static_cast<uint8_t>(WireType::None)) {
        present = false;
        return true;
    }
    return Fail();
}

} // namespace bitsagent
