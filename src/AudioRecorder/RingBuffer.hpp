#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "AudioFrameBlock.hpp"

enum class PushResult {
    Ok,
    // The block was stored but the oldest one was dropped, or the block could not be
    // stored at all. Either way the overrun counter was incremented.
    Overrun,
};

/**
 * Fixed-capacity single-producer/single-consumer queue of audio blocks.
 *
 * Slot storage is allocated once in the constructor; Push never allocates, locks or
 * blocks, so it can run inside the driver callback. When the buffer already holds
 * `capacity` blocks, Push drops the oldest one and counts an overrun.
 *
 * Cursors are monotonic 64-bit counters. There is one more physical slot than the
 * capacity, so the slot being filled never aliases the slot the consumer has claimed
 * for copying, except in the one case handled in Push.
 */
class RingBuffer {
public:
    RingBuffer(size_t capacity, size_t maxBlockFrames);

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    // Producer side.
    PushResult Push(const float* samples, size_t numFrames, uint64_t sequence, uint64_t captureTimeUs);
    PushResult Push(const AudioFrameBlock& block);

    // Consumer side. Never blocks; returns every block available, oldest first.
    std::vector<AudioFrameBlock> DrainAll();

    // Consumer side. Throws away everything currently buffered.
    size_t Discard();

    size_t Size() const;
    size_t Capacity() const { return _capacity; }
    size_t MaxBlockFrames() const { return _maxBlockFrames; }
    uint64_t OverrunCount() const { return _overruns.load(std::memory_order_relaxed); }

private:
    struct Slot {
        uint64_t sequence = 0;
        uint64_t captureTimeUs = 0;
        size_t numFrames = 0;
        std::vector<float> samples;
    };

    static constexpr uint64_t kNoClaim = UINT64_MAX;

    bool ClaimOldest(uint64_t& index);

    const size_t _capacity;
    const size_t _maxBlockFrames;
    std::vector<Slot> _slots;

    std::atomic<uint64_t> _head; // next index the producer writes
    std::atomic<uint64_t> _tail; // oldest live index
    std::atomic<uint64_t> _claimed;
    std::atomic<uint64_t> _overruns;
};
