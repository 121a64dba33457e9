#include "CaptureEngine.hpp"
#include "../SavingWorkers/WavEncoder.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

const char* ToString(CaptureState state) {
    switch (state) {
        case CaptureState::Idle: return "Idle";
        case CaptureState::Monitoring: return "Monitoring";
        case CaptureState::Recording: return "Recording";
        case CaptureState::Stopped: return "Stopped";
    }
    return "Unknown";
}

CaptureEngine::CaptureEngine(std::shared_ptr<IAudioDevice> device, CaptureConfig config)
    : _device(std::move(device))
    , _config(std::move(config))
    , _state(CaptureState::Idle)
    , _takeSampleRate(0)
    , _level(0.0f)
    , _overruns(0) {
    if (!_device) {
        throw std::invalid_argument("CaptureEngine requires an audio device");
    }
}

CaptureEngine::~CaptureEngine() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_session) {
        CloseSessionLocked(false);
    }
}

void CaptureEngine::OnInput(const float* samples, size_t numFrames, double streamTime) {
    CaptureSession* session = _session.get();
    if (!session || !samples) {
        return;
    }

    RingBuffer& ring = *session->ring;
    const uint64_t captureTimeUs = static_cast<uint64_t>(std::max(0.0, streamTime) * 1e6);

    // The driver may hand over more frames than a slot holds; split them.
    size_t offset = 0;
    while (offset < numFrames) {
        size_t n = std::min(ring.MaxBlockFrames(), numFrames - offset);
        ring.Push(samples + offset, n, session->nextSequence++, captureTimeUs);
        offset += n;
    }
}

void CaptureEngine::Start() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != CaptureState::Idle && _state != CaptureState::Stopped) {
        throw InvalidState(std::string("Start requires Idle or Stopped, engine is ") + ToString(_state));
    }

    _session = std::make_unique<CaptureSession>();
    _session->ring = std::make_unique<RingBuffer>(_config.ringCapacityBlocks, _config.framesPerBlock);

    try {
        _description = _device->Open(_config.preferredSampleRates, _config.framesPerBlock,
                                     [this](const float* samples, size_t numFrames, double streamTime) {
                                         OnInput(samples, numFrames, streamTime);
                                     });
    } catch (const std::exception&) {
        _session.reset();
        throw;
    }

    _level = 0.0f;
    _state = CaptureState::Monitoring;
    DEBUG_LOG("Monitoring " << _description.name << " at " << _description.sampleRate << " Hz" << DEBUG_LOG_ENDL);
}

void CaptureEngine::Record() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != CaptureState::Monitoring) {
        throw InvalidState(std::string("Record requires Monitoring, engine is ") + ToString(_state));
    }

    // Blocks captured before this point belong to the monitor, not the take.
    DrainLocked(false);
    _take.clear();
    _takeSampleRate = _description.sampleRate;
    _state = CaptureState::Recording;

    DEBUG_LOG("\n=== Starting recording ===" << DEBUG_LOG_ENDL);
}

void CaptureEngine::Stop() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == CaptureState::Recording) {
        CloseSessionLocked(true);
        DEBUG_LOG("Recording stopped." << DEBUG_LOG_ENDL);
        DEBUG_LOG("Recorded " << _take.size() << " samples" << DEBUG_LOG_ENDL);
    } else if (_state == CaptureState::Monitoring) {
        CloseSessionLocked(false);
    } else {
        throw InvalidState(std::string("Stop requires Recording or Monitoring, engine is ") + ToString(_state));
    }
    _state = CaptureState::Stopped;
}

size_t CaptureEngine::Pump() {
    std::lock_guard<std::mutex> lock(_mutex);
    switch (_state) {
        case CaptureState::Monitoring: return DrainLocked(false);
        case CaptureState::Recording: return DrainLocked(true);
        default: return 0;
    }
}

size_t CaptureEngine::DrainLocked(bool keep) {
    if (!_session) {
        return 0;
    }

    RingBuffer& ring = *_session->ring;
    std::vector<AudioFrameBlock> blocks = ring.DrainAll();

    double sumSquares = 0.0;
    size_t count = 0;
    for (const AudioFrameBlock& block : blocks) {
        for (float s : block.samples) {
            sumSquares += static_cast<double>(s) * s;
        }
        count += block.samples.size();
        if (keep) {
            _take.insert(_take.end(), block.samples.begin(), block.samples.end());
        }
    }
    if (count > 0) {
        _level = static_cast<float>(std::sqrt(sumSquares / static_cast<double>(count)));
    }

    uint64_t overruns = ring.OverrunCount();
    if (overruns != _session->reportedOverruns) {
        DEBUG_LOG("Ring buffer overrun: " << (overruns - _session->reportedOverruns)
                  << " block(s) lost" << DEBUG_LOG_ENDL);
        _session->reportedOverruns = overruns;
    }

    return blocks.size();
}

void CaptureEngine::CloseSessionLocked(bool keep) {
    // No callback runs after Close, so the final drain sees every pushed block.
    _device->Close();
    size_t drained = DrainLocked(keep);
    if (!keep && drained > 0) {
        DEBUG_LOG("Discarded " << drained << " monitor block(s)" << DEBUG_LOG_ENDL);
    }
    _overruns += _session->ring->OverrunCount();
    _session.reset();
}

std::optional<RenderArtifact> CaptureEngine::Export() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == CaptureState::Recording) {
        DrainLocked(true);
    }
    if (_take.empty()) {
        return std::nullopt;
    }

    RenderArtifact artifact;
    artifact.bytes = EncodeWav(_take, _takeSampleRate);
    artifact.createdAtMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    artifact.sampleRate = _takeSampleRate;
    artifact.sampleCount = _take.size();

    _latest = artifact;
    return artifact;
}

CaptureState CaptureEngine::State() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

DeviceDescription CaptureEngine::Device() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _description;
}

unsigned int CaptureEngine::SampleRate() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _description.sampleRate;
}

float CaptureEngine::Level() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _level;
}

uint64_t CaptureEngine::OverrunCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _overruns + (_session ? _session->ring->OverrunCount() : 0);
}

size_t CaptureEngine::RecordedSampleCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _take.size();
}

std::vector<float> CaptureEngine::RecordedSamples() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _take;
}

std::optional<RenderArtifact> CaptureEngine::LatestArtifact() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _latest;
}
