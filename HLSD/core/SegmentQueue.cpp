#include "SegmentQueue.h"

SegmentQueue::SegmentQueue(std::size_t capacity)
    : maxSize(capacity) {
}

bool SegmentQueue::push(SegmentDescriptor segment) {
    std::lock_guard<std::mutex> lock(mtx);
    if (pending.size() >= maxSize)
        return false;

    pending.push_back(std::move(segment));
    return true;
}

std::optional<SegmentDescriptor> SegmentQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mtx);
    if (pending.empty())
        return std::nullopt;

    SegmentDescriptor seg = std::move(pending.front());
    pending.pop_front();
    return seg;
}

bool SegmentQueue::empty() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.empty();
}

std::size_t SegmentQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}

std::size_t SegmentQueue::capacity() const {
    return maxSize;
}
