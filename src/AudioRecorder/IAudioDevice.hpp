#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../common/Errors.hpp"

struct DeviceDescription {
    std::string name;
    unsigned int sampleRate = 0;
    unsigned int framesPerBlock = 0;
};

// Mono input source. Implementations call the input callback on their real-time thread.
class IAudioDevice {
public:
    // (samples, numFrames, streamTimeSeconds)
    using InputCallback = std::function<void(const float*, size_t, double)>;

    virtual ~IAudioDevice() = default;

    // Acquires the device and starts delivering input.
    // Throws DeviceUnavailable or DeviceConfigRejected.
    virtual DeviceDescription Open(const std::vector<unsigned int>& preferredRates,
                                   unsigned int framesPerBlock,
                                   InputCallback callback) = 0;

    // Stops delivery. No callback is running once this returns.
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    // Overflows reported by the driver itself, not by our ring buffer.
    virtual uint64_t DriverOverflowCount() const { return 0; }
};

// First preferred rate the device supports.
inline unsigned int NegotiateSampleRate(const std::vector<unsigned int>& supported,
                                        const std::vector<unsigned int>& preferred) {
    for (unsigned int rate : preferred) {
        for (unsigned int sr : supported) {
            if (sr == rate) {
                return rate;
            }
        }
    }

    std::string wanted;
    for (unsigned int rate : preferred) {
        wanted += (wanted.empty() ? "" : ", ") + std::to_string(rate);
    }
    throw DeviceConfigRejected("No supported sample rate among preferred rates [" + wanted + "]");
}
