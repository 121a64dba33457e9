#include "RtAudioDevice.hpp"
#include "../common/debug_log.hpp"

int RtAudioDevice::Record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                          double streamTime, RtAudioStreamStatus status, void* userData)
{
    RtAudioDevice* device = static_cast<RtAudioDevice*>(userData);

    if (status & RTAUDIO_INPUT_OVERFLOW) {
        device->_overflows.fetch_add(1, std::memory_order_relaxed);
    }

    if (inputBuffer && device->_callback) {
        device->_callback(static_cast<const float*>(inputBuffer), nBufferFrames, streamTime);
    }

    return 0;
}

RtAudioDevice::RtAudioDevice()
    : _audio(std::make_unique<RtAudio>())
    , _overflows(0) {
}

RtAudioDevice::~RtAudioDevice() {
    Close();
}

unsigned int RtAudioDevice::SelectInputDevice() {
    std::vector<unsigned int> deviceIds = _audio->getDeviceIds();
    if (deviceIds.empty()) {
        throw DeviceUnavailable("No audio devices found");
    }

    DEBUG_LOG("Available audio devices:" << DEBUG_LOG_ENDL);
    for (unsigned int i = 0; i < deviceIds.size(); i++) {
        RtAudio::DeviceInfo info = _audio->getDeviceInfo(deviceIds[i]);
        DEBUG_LOG("Device " << i << " (ID: " << deviceIds[i] << "): " << info.name
                  << ", input channels: " << info.inputChannels << DEBUG_LOG_ENDL);
    }

    unsigned int selected = _audio->getDefaultInputDevice();
    RtAudio::DeviceInfo selectedInfo = _audio->getDeviceInfo(selected);

    if (selectedInfo.inputChannels < 1) {
        DEBUG_LOG("Default device has no input channels! Searching for alternative..." << DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo info = _audio->getDeviceInfo(id);
            if (info.inputChannels > 0) {
                selected = id;
                selectedInfo = info;
                break;
            }
        }
    }

    if (selectedInfo.inputChannels < 1) {
        throw DeviceUnavailable("No input devices found");
    }
    return selected;
}

DeviceDescription RtAudioDevice::Open(const std::vector<unsigned int>& preferredRates,
                                      unsigned int framesPerBlock,
                                      InputCallback callback) {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    if (_audio->isStreamOpen()) {
        throw InvalidState("Audio device is already open");
    }

    unsigned int deviceId = SelectInputDevice();
    RtAudio::DeviceInfo info = _audio->getDeviceInfo(deviceId);

    unsigned int sampleRate = NegotiateSampleRate(info.sampleRates, preferredRates);

    _parameters.deviceId = deviceId;
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;
    _callback = std::move(callback);
    _overflows = 0;

    unsigned int bufferFrames = framesPerBlock;

    DEBUG_LOG("Opening input stream on " << info.name << DEBUG_LOG_ENDL);
    DEBUG_LOG("  Sample rate: " << sampleRate << DEBUG_LOG_ENDL);
    DEBUG_LOG("  Buffer frames: " << bufferFrames << DEBUG_LOG_ENDL);
    DEBUG_LOG("  Format: FLOAT32" << DEBUG_LOG_ENDL);

    if (_audio->openStream(nullptr, &_parameters, RTAUDIO_FLOAT32,
                           sampleRate, &bufferFrames, &RtAudioDevice::Record, this)) {
        _callback = nullptr;
        throw DeviceUnavailable("Error opening stream on " + info.name + ": " + _audio->getErrorText());
    }

    if (_audio->startStream()) {
        std::string error = _audio->getErrorText();
        _audio->closeStream();
        _callback = nullptr;
        throw DeviceUnavailable("Error starting stream on " + info.name + ": " + error);
    }

    // The driver may round the block size.
    DEBUG_LOG("Stream running with " << bufferFrames << " frames per block" << DEBUG_LOG_ENDL);

    DeviceDescription description;
    description.name = info.name;
    description.sampleRate = sampleRate;
    description.framesPerBlock = bufferFrames;
    return description;
}

void RtAudioDevice::Close() {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    if (_audio->isStreamRunning()) {
        _audio->stopStream();
    }
    if (_audio->isStreamOpen()) {
        _audio->closeStream();
    }
    _callback = nullptr;
}

bool RtAudioDevice::IsOpen() const {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    return _audio->isStreamOpen();
}
