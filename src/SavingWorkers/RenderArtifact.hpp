#pragma once

#include <cstdint>
#include <string>
#include <vector>

// A finished WAV render. Built once per export and never modified afterwards.
struct RenderArtifact {
    static constexpr const char* kMimeType = "audio/wav";
    static constexpr const char* kSuggestedFileName = "wasmix-recording.wav";

    std::vector<uint8_t> bytes;
    uint64_t createdAtMs = 0;
    unsigned int sampleRate = 0;
    size_t sampleCount = 0;

    size_t Size() const { return bytes.size(); }
};
