#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include "utils.h"

// Bounded FIFO of segments still to fetch. Filled once by the session,
// drained concurrently by the workers.
class SegmentQueue {
public:
    explicit SegmentQueue(std::size_t capacity);

    bool push(SegmentDescriptor segment);
    std::optional<SegmentDescriptor> tryPop();

    bool empty() const;
    std::size_t size() const;
    std::size_t capacity() const;

private:
    std::deque<SegmentDescriptor> pending;
    std::size_t maxSize;
    mutable std::mutex mtx;
};
