#include "status.hpp"

namespace owah {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::OpenError: return "OpenError";
        case ErrorCode::ProbeError: return "ProbeError";
        case ErrorCode::MissingFormatInfo: return "MissingFormatInfo";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::EmptyDecodeResult: return "EmptyDecodeResult";
        case ErrorCode::PlaybackError: return "PlaybackError";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
    }
    return "Unknown";
}

} // namespace owah
