#pragma once
// BitsAgent v1.00 - GUID Helpers
// Job identifiers are GUIDs; formatted as {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}

#include "types.h"
#include <objbase.h>
#include <cstring>
#include <optional>
#include <string>

namespace bitsagent {

using JobId = GUID;

inline std::wstring FormatGuid(const GUID& guid) {
    wchar_t buffer[40] = {};
    int len = StringFromGUID2(guid, buffer, 40);
    if (len <= 0) {
        return L"";
    }
    return std::wstring(buffer, static_cast<size_t>(len - 1));
}

// Accepts the braced form; the braces are added when missing
inline std::optional<GUID> ParseGuid(const std::wstring& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::wstring braced = text;
    if (braced.front() != L'{') {
        braced = L"{" + braced + L"}";
    }
    if (braced.size() != 38) {
        return std::nullopt;
    }

    GUID guid;
    if (FAILED(IIDFromString(braced.c_str(), &guid))) {
        return std::nullopt;
    }
    return guid;
}

// Strict weak ordering for use as a std::map key
struct GuidLess {
    bool operator()(const GUID& a, const GUID& b) const noexcept {
        return std::memcmp(&a, &b, sizeof(GUID)) < 0;
    }
};

} // namespace bitsagent
