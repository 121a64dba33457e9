#include "RingBuffer.hpp"

#include <algorithm>
#include <stdexcept>

RingBuffer::RingBuffer(size_t capacity, size_t maxBlockFrames)
    : _capacity(capacity)
    , _maxBlockFrames(maxBlockFrames)
    , _head(0)
    , _tail(0)
    , _claimed(kNoClaim)
    , _overruns(0) {
    if (capacity == 0) {
        throw std::invalid_argument("RingBuffer capacity must be positive");
    }
    if (maxBlockFrames == 0) {
        throw std::invalid_argument("RingBuffer block size must be positive");
    }

    _slots.resize(capacity + 1);
    for (Slot& slot : _slots) {
        slot.samples.resize(maxBlockFrames);
    }
}

PushResult RingBuffer::Push(const AudioFrameBlock& block) {
    return Push(block.samples.data(), block.samples.size(), block.sequence, block.captureTimeUs);
}

PushResult RingBuffer::Push(const float* samples, size_t numFrames, uint64_t sequence, uint64_t captureTimeUs) {
    if (numFrames > _maxBlockFrames || (numFrames > 0 && !samples)) {
        _overruns.fetch_add(1, std::memory_order_relaxed);
        return PushResult::Overrun;
    }

    PushResult result = PushResult::Ok;
    const uint64_t head = _head.load(std::memory_order_relaxed);
    uint64_t tail = _tail.load(std::memory_order_seq_cst);

    // Full: drop the oldest block. A failed exchange means the consumer took it.
    while (head - tail >= _capacity) {
        if (_tail.compare_exchange_weak(tail, tail + 1, std::memory_order_seq_cst)) {
            _overruns.fetch_add(1, std::memory_order_relaxed);
            result = PushResult::Overrun;
            break;
        }
    }

    const size_t slotCount = _slots.size();
    const uint64_t claimed = _claimed.load(std::memory_order_seq_cst);
    if (claimed != kNoClaim && claimed % slotCount == head % slotCount) {
        // The consumer is still copying the block that used to live in this slot.
        _overruns.fetch_add(1, std::memory_order_relaxed);
        return PushResult::Overrun;
    }

    Slot& slot = _slots[head % slotCount];
    slot.sequence = sequence;
    slot.captureTimeUs = captureTimeUs;
    slot.numFrames = numFrames;
    std::copy(samples, samples + numFrames, slot.samples.begin());

    _head.store(head + 1, std::memory_order_release);
    return result;
}

bool RingBuffer::ClaimOldest(uint64_t& index) {
    while (true) {
        uint64_t tail = _tail.load(std::memory_order_acquire);
        if (tail >= _head.load(std::memory_order_acquire)) {
            return false;
        }

        _claimed.store(tail, std::memory_order_seq_cst);
        if (_tail.compare_exchange_strong(tail, tail + 1, std::memory_order_seq_cst)) {
            index = tail;
            return true;
        }
        // Dropped by the producer in the meantime.
        _claimed.store(kNoClaim, std::memory_order_release);
    }
}

std::vector<AudioFrameBlock> RingBuffer::DrainAll() {
    std::vector<AudioFrameBlock> blocks;
    blocks.reserve(Size());

    uint64_t index = 0;
    while (ClaimOldest(index)) {
        const Slot& slot = _slots[index % _slots.size()];

        AudioFrameBlock block;
        block.sequence = slot.sequence;
        block.captureTimeUs = slot.captureTimeUs;
        block.samples.assign(slot.samples.begin(), slot.samples.begin() + slot.numFrames);
        blocks.push_back(std::move(block));

        _claimed.store(kNoClaim, std::memory_order_release);
    }
    return blocks;
}

size_t RingBuffer::Discard() {
    size_t discarded = 0;
    uint64_t index = 0;
    while (ClaimOldest(index)) {
        _claimed.store(kNoClaim, std::memory_order_release);
        ++discarded;
    }
    return discarded;
}

size_t RingBuffer::Size() const {
    const uint64_t tail = _tail.load(std::memory_order_acquire);
    const uint64_t head = _head.load(std::memory_order_acquire);
    return head > tail ? static_cast<size_t>(head - tail) : 0;
}
