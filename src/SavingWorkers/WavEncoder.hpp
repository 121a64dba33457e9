#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct WavInfo {
    unsigned int sampleRate = 0;
    unsigned int numChannels = 0;
    unsigned int bitsPerSample = 0;
    uint64_t frames = 0;
};

// Clamps to [-1, 1] and rounds to nearest. 1.0 maps to 32767, -1.0 to -32768.
int16_t QuantizeSample(float sample);

// Canonical mono 16-bit PCM WAV. An empty input gives a header-only file.
// Throws std::runtime_error if libsndfile refuses the format.
std::vector<uint8_t> EncodeWav(const float* samples, size_t numSamples, unsigned int sampleRate);
std::vector<uint8_t> EncodeWav(const std::vector<float>& samples, unsigned int sampleRate);

// Both throw std::runtime_error if the bytes are not a WAV file libsndfile can read.
WavInfo ReadWavInfo(const std::vector<uint8_t>& bytes);
std::vector<int16_t> DecodeWav(const std::vector<uint8_t>& bytes);
