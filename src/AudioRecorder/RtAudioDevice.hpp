#pragma once

#include <RtAudio.h>

#include <atomic>
#include <memory>
#include <mutex>

#include "IAudioDevice.hpp"

class RtAudioDevice : public IAudioDevice {
public:
    RtAudioDevice();
    ~RtAudioDevice() override;

    DeviceDescription Open(const std::vector<unsigned int>& preferredRates,
                           unsigned int framesPerBlock,
                           InputCallback callback) override;
    void Close() override;
    bool IsOpen() const override;
    uint64_t DriverOverflowCount() const override { return _overflows.load(); }

private:
    static int Record(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                      double streamTime, RtAudioStreamStatus status, void* userData);

    unsigned int SelectInputDevice();

    std::unique_ptr<RtAudio> _audio;
    RtAudio::StreamParameters _parameters;
    InputCallback _callback;
    std::atomic<uint64_t> _overflows;
    mutable std::mutex _stream_mutex;
};
