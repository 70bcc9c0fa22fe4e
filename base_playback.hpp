#pragma once

#include <string>
#include <vector>

namespace owah {

class BasePlayback {
public:
    virtual ~BasePlayback() = default;
    virtual bool is_ready() const = 0;
    // Blocks until the device accepted the frames. Returns false on an
    // unrecoverable device error.
    virtual bool write(const std::vector<float>& interleaved_data, int num_frames) = 0;
    virtual int sample_rate() const = 0;
    virtual int channels() const = 0;
    virtual std::string name() const = 0;
};

} // namespace owah
