#pragma once

#include <cstdint>
#include <vector>

// One capture quantum as delivered by the driver callback.
struct AudioFrameBlock {
    uint64_t sequence = 0;
    // Microseconds since the stream was started.
    uint64_t captureTimeUs = 0;
    std::vector<float> samples;
};
