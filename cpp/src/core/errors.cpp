#include "frameisa/core/errors.hpp"

namespace frameisa::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::InvalidLength: return "InvalidLength";
        case StatusCode::InvalidOpcodeText: return "InvalidOpcodeText";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Isa: return "Isa";
        case StatusDomain::Storage: return "Storage";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace frameisa::core
