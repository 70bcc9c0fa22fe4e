#pragma once

#include <string>
#include <utility>

namespace owah {

enum class ErrorCode {
    None,
    OpenError,
    ProbeError,
    MissingFormatInfo,
    DecodeError,
    EmptyDecodeResult,
    PlaybackError,
    DeviceUnavailable,
};

const char* errorCodeName(ErrorCode code);

struct Status {
    ErrorCode code = ErrorCode::None;
    std::string message;

    bool ok() const { return code == ErrorCode::None; }

    static Status Ok() { return Status(); }
    static Status Error(ErrorCode code, std::string message) {
        Status s;
        s.code = code;
        s.message = std::move(message);
        return s;
    }
};

} // namespace owah
