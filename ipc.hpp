#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "clip.hpp"
#include "status.hpp"

namespace ipc {

// Frames are a native-endian uint32 size followed by the flatbuffer.
void sendNotification(const uint8_t* buf, size_t size);
void sendAck(const char* cmd_type, bool success);
void sendLog(const std::string& msg);
void sendStatus(const std::string& msg, const owah::Status& status);
void sendBiteInfo(const owah::SampleClip& clip, int duration_ms);
void sendDeviceInfo(bool available, const std::string& name, int sample_rate, int channels);

} // namespace ipc
