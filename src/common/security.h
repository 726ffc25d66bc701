#pragma once
// BitsAgent v1.00 - Pipe Security Helpers
// Named Pipe DACL construction

#include "scoped_handle.h"
#include <sddl.h>
#include <string>

namespace bitsagent {

// LocalService (S-1-5-19) may read and write the duplex command pipe
constexpr const wchar_t* SDDL_LOCAL_SERVICE_DUPLEX = L"D:(A;;GRGW;;;LS)";

// LocalService may only write to an inbound monitor pipe.
// 0x40000080 = GENERIC_WRITE | FILE_READ_ATTRIBUTES (CreateFile on a pipe needs the latter)
constexpr const wchar_t* SDDL_LOCAL_SERVICE_INBOUND = L"D:(A;;0x40000080;;;LS)";

// Security attributes for CreateNamedPipeW. Until Initialize succeeds the pipe gets the
// default DACL (creator and administrators).
class PipeSecurityDescriptor {
public:
    PipeSecurityDescriptor() {
        ZeroMemory(&sa_, sizeof(sa_));
    }

    PipeSecurityDescriptor(const PipeSecurityDescriptor&) = delete;
    PipeSecurityDescriptor& operator=(const PipeSecurityDescriptor&) = delete;

    // false with GetLastError() set when the SDDL is rejected
    bool Initialize(const std::wstring& sddl) {
        PSECURITY_DESCRIPTOR raw = nullptr;
        if (!ConvertStringSecurityDescriptorToSecurityDescriptorW(
                sddl.c_str(), SDDL_REVISION_1, &raw, nullptr)) {
            return false;
        }
        descriptor_.reset(raw);

        sa_.nLength = sizeof(SECURITY_ATTRIBUTES);
        sa_.lpSecurityDescriptor = descriptor_.get();
        sa_.bInheritHandle = FALSE;
        return true;
    }

    SECURITY_ATTRIBUTES* GetSecurityAttributes() {
        return descriptor_ ? &sa_ : nullptr;
    }

private:
    SECURITY_ATTRIBUTES sa_;
    ScopedLocalMem descriptor_;
};

} // namespace bitsagent
