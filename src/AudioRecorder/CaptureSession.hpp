#pragma once

#include <cstdint>
#include <memory>

#include "RingBuffer.hpp"

// Everything that lives between Start() and Stop(). The ring buffer is the only
// part the driver thread touches; nextSequence is written by that thread alone.
struct CaptureSession {
    std::unique_ptr<RingBuffer> ring;
    uint64_t nextSequence = 0;
    uint64_t reportedOverruns = 0;
};
