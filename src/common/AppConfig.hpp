#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct AppConfig {
    std::string storeRoot = "./wasmix-store";
    std::string documentId = "default";
    std::vector<unsigned int> preferredSampleRates = {48000, 44100};
    unsigned int framesPerBlock = 128;
    size_t ringCapacityBlocks = 64;
    std::string renderPath = "renders/mixdown.wav";
    std::string exportPath = "wasmix-recording.wav";
    // Journal entries between automatic snapshots, 0 disables.
    size_t snapshotInterval = 32;
};

// Reads a JSON config file on top of the defaults. Missing keys keep their default.
// Throws std::runtime_error if the file can't be read or a key has the wrong type.
AppConfig LoadAppConfig(const std::string& path);

// Applies --config, --store and --doc. Unknown arguments throw std::invalid_argument.
AppConfig ParseCommandLine(int argc, char* argv[]);
