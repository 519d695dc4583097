#include "Errors.hpp"

namespace whodat {

const char* toString(ProbeError::Code code) {
    switch (code) {
        case ProbeError::Code::NotADeviceNode: return "NotADeviceNode";
        case ProbeError::Code::PermissionDenied: return "PermissionDenied";
        case ProbeError::Code::QueryFailed: return "QueryFailed";
        case ProbeError::Code::UnsupportedBusType: return "UnsupportedBusType";
    }
    return "Unknown";
}

const char* toString(BuildError::Code code) {
    switch (code) {
        case BuildError::Code::NoSource: return "NoSource";
        case BuildError::Code::AmbiguousSource: return "AmbiguousSource";
        case BuildError::Code::IdMismatch: return "IdMismatch";
    }
    return "Unknown";
}

} // namespace whodat
