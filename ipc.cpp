#include "ipc.hpp"
#include "openwah_response_generated.h"

#include <iostream>
#include <mutex>
#include <vector>

namespace ipc {

namespace {
constexpr int kWaveformPoints = 256;
}

void sendNotification(const uint8_t* buf, size_t size) {
    static std::mutex cout_mutex;
    std::lock_guard<std::mutex> lock(cout_mutex);
    uint32_t msg_size = static_cast<uint32_t>(size);
    std::cout.write(reinterpret_cast<const char*>(&msg_size), sizeof(msg_size));
    std::cout.write(reinterpret_cast<const char*>(buf), size);
    std::cout.flush();
}

void sendAck(const char* cmd_type, bool success) {
    flatbuffers::FlatBufferBuilder builder(128);
    auto cmd_type_off = builder.CreateString(cmd_type);
    auto ack_off = openwah::ipc::CreateAcknowledge(builder, cmd_type_off, success);
    auto nf_off = openwah::ipc::CreateNotification(builder, openwah::ipc::Response_Acknowledge, ack_off.Union());
    builder.Finish(nf_off);
    sendNotification(builder.GetBufferPointer(), builder.GetSize());
}

void sendLog(const std::string& msg) {
    flatbuffers::FlatBufferBuilder builder(512);
    auto msg_off = builder.CreateString(msg);
    auto log_off = openwah::ipc::CreateLog(builder, msg_off);
    auto nf_off = openwah::ipc::CreateNotification(builder, openwah::ipc::Response_Log, log_off.Union());
    builder.Finish(nf_off);
    sendNotification(builder.GetBufferPointer(), builder.GetSize());
}

void sendStatus(const std::string& msg, const owah::Status& status) {
    flatbuffers::FlatBufferBuilder builder(512);
    auto msg_off = builder.CreateString(msg);
    auto err_off = builder.CreateString(status.ok() ? "" : owah::errorCodeName(status.code));
    auto st_off = openwah::ipc::CreateStatusMessage(builder, msg_off, err_off);
    auto nf_off = openwah::ipc::CreateNotification(builder, openwah::ipc::Response_StatusMessage, st_off.Union());
    builder.Finish(nf_off);
    sendNotification(builder.GetBufferPointer(), builder.GetSize());
}

void sendBiteInfo(const owah::SampleClip& clip, int duration_ms) {
    std::vector<float> waveform = owah::waveformSummary(clip, kWaveformPoints);

    flatbuffers::FlatBufferBuilder builder(1024 + kWaveformPoints * 4);
    auto path_off = builder.CreateString(clip.path);
    auto wf_vec = builder.CreateVector(waveform);
    auto info_off = openwah::ipc::CreateBiteInfo(builder, path_off, clip.sample_rate, clip.num_channels,
                                                 (int64_t)clip.frames(), duration_ms, clip.path.empty(), wf_vec);
    auto nf_off = openwah::ipc::CreateNotification(builder, openwah::ipc::Response_BiteInfo, info_off.Union());
    builder.Finish(nf_off);
    sendNotification(builder.GetBufferPointer(), builder.GetSize());
}

void sendDeviceInfo(bool available, const std::string& name, int sample_rate, int channels) {
    flatbuffers::FlatBufferBuilder builder(256);
    auto name_off = builder.CreateString(name);
    auto dev_off = openwah::ipc::CreateDeviceInfo(builder, available, name_off, sample_rate, channels);
    auto nf_off = openwah::ipc::CreateNotification(builder, openwah::ipc::Response_DeviceInfo, dev_off.Union());
    builder.Finish(nf_off);
    sendNotification(builder.GetBufferPointer(), builder.GetSize());
}

} // namespace ipc
