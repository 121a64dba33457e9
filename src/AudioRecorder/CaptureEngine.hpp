#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "CaptureSession.hpp"
#include "IAudioDevice.hpp"
#include "../SavingWorkers/RenderArtifact.hpp"

enum class CaptureState {
    Idle,
    Monitoring,
    Recording,
    Stopped,
};

const char* ToString(CaptureState state);

struct CaptureConfig {
    std::vector<unsigned int> preferredSampleRates = {48000, 44100};
    unsigned int framesPerBlock = 128;
    size_t ringCapacityBlocks = 64;
};

/**
 * Owns the capture state machine:
 *
 *   Idle --Start--> Monitoring --Record--> Recording --Stop--> Stopped --Start--> Monitoring
 *
 * The device callback only pushes into the session's RingBuffer. Everything else
 * (draining, accumulating the take, level metering, encoding) happens on the caller's
 * thread through Pump(), Stop() and Export(). Transitions are serialized; a call that
 * doesn't fit the current state throws InvalidState.
 */
class CaptureEngine {
public:
    CaptureEngine(std::shared_ptr<IAudioDevice> device, CaptureConfig config);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    // Idle or Stopped -> Monitoring. Throws DeviceUnavailable, DeviceConfigRejected.
    void Start();
    // Monitoring -> Recording. Starts a new take.
    void Record();
    // Recording or Monitoring -> Stopped. A take keeps every block captured before
    // the stream closed; blocks buffered while only monitoring are discarded.
    void Stop();

    // Drains the ring buffer. Returns the number of blocks consumed.
    size_t Pump();

    // Encodes the current take. Empty if nothing has been recorded.
    std::optional<RenderArtifact> Export();

    CaptureState State() const;
    DeviceDescription Device() const;
    unsigned int SampleRate() const;
    float Level() const;
    uint64_t OverrunCount() const;
    size_t RecordedSampleCount() const;
    std::vector<float> RecordedSamples() const;
    std::optional<RenderArtifact> LatestArtifact() const;

private:
    void OnInput(const float* samples, size_t numFrames, double streamTime);
    size_t DrainLocked(bool keep);
    void CloseSessionLocked(bool keep);

    std::shared_ptr<IAudioDevice> _device;
    CaptureConfig _config;

    mutable std::mutex _mutex;
    CaptureState _state;
    std::unique_ptr<CaptureSession> _session;
    DeviceDescription _description;
    std::vector<float> _take;
    unsigned int _takeSampleRate;
    float _level;
    uint64_t _overruns;
    std::optional<RenderArtifact> _latest;
};
