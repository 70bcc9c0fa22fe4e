#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "alsa_out.hpp"
#include "audio_types.hpp"
#include "engine.hpp"
#include "ipc.hpp"
#include "piano.hpp"

#include "openwah_request_generated.h"

using owah::Status;

static void reportBite(owah::SamplePiano& piano, const char* cmd, const Status& status) {
    ipc::sendAck(cmd, status.ok());
    ipc::sendStatus(piano.status(), status);
    if (status.ok()) {
        ipc::sendBiteInfo(*piano.current_clip(), piano.bite_duration_ms());
    }
}

int main(int argc, char** argv) {
    owah::EngineConfig config;
    owah::DecodeOptions decode_options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list") {
            owah::AlsaPlayback::listDevices();
            return 0;
        } else if (arg == "--device") {
            if (i + 1 >= argc) {
                std::cerr << "--device needs a PCM name" << std::endl;
                return 1;
            }
            config.device = argv[++i];
        } else if (arg == "--poly") {
            config.voice_policy = owah::VoicePolicy::FireAndForget;
        } else if (arg == "--mono") {
            decode_options.channel_mode = owah::ChannelMode::Mono;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return 1;
        }
    }

    owah::SamplePiano piano(owah::createEngine(config), decode_options);

    ipc::sendDeviceInfo(piano.has_device(), config.device, config.sample_rate, config.channels);
    ipc::sendStatus(piano.status(), Status::Ok());
    ipc::sendBiteInfo(*piano.current_clip(), piano.bite_duration_ms());

    while (true) {
        uint32_t msg_size = 0;
        std::cin.read(reinterpret_cast<char*>(&msg_size), sizeof(msg_size));
        if (std::cin.eof()) break;
        if (std::cin.fail()) {
            std::cerr << "BACKEND ERROR: Failed to read message size from stdin" << std::endl;
            break;
        }

        if (msg_size > 1024 * 1024) { // 1MB limit for safety
            std::cerr << "BACKEND ERROR: Message size too large: " << msg_size << std::endl;
            break;
        }

        std::unique_ptr<uint8_t[]> buffer(new uint8_t[msg_size]);
        std::cin.read(reinterpret_cast<char*>(buffer.get()), msg_size);
        if (std::cin.fail()) {
            std::cerr << "BACKEND ERROR: Failed to read message payload from stdin" << std::endl;
            break;
        }

        flatbuffers::Verifier verifier(buffer.get(), msg_size);
        if (!openwah::ipc::VerifyRequestBuffer(verifier)) {
            std::cerr << "BACKEND ERROR: Malformed request" << std::endl;
            ipc::sendLog("Ignored malformed request");
            continue;
        }

        auto request = openwah::ipc::GetRequest(buffer.get());
        auto command_type = request->command_type();

        if (command_type == openwah::ipc::Command_LoadBite) {
            auto cmd = request->command_as_LoadBite();
            std::string path = cmd->path() ? cmd->path()->str() : "";
            reportBite(piano, "LOAD_BITE", piano.load_bite(path));
        } else if (command_type == openwah::ipc::Command_SetBiteDuration) {
            auto cmd = request->command_as_SetBiteDuration();
            reportBite(piano, "SET_BITE_DURATION", piano.set_bite_duration(cmd->duration_ms()));
        } else if (command_type == openwah::ipc::Command_UseTone) {
            piano.use_tone();
            reportBite(piano, "USE_TONE", Status::Ok());
        } else if (command_type == openwah::ipc::Command_PlayNote) {
            auto cmd = request->command_as_PlayNote();
            Status status = piano.play_note(cmd->note());
            if (!status.ok()) {
                ipc::sendStatus(piano.status(), status);
            }
            ipc::sendAck("PLAY_NOTE", status.ok());
        } else if (command_type == openwah::ipc::Command_StopAll) {
            piano.stop();
            ipc::sendAck("STOP_ALL", true);
        } else if (command_type == openwah::ipc::Command_Quit) {
            ipc::sendAck("QUIT", true);
            break;
        } else {
            ipc::sendLog("Unknown command");
        }
    }

    piano.stop();
    return 0;
}
