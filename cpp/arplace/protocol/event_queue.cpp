#include "arplace/protocol/event_queue.h"
#include "arplace/core/logging.h"

#include <algorithm>

namespace arplace {

using protocol::EventBufferMeta;
using protocol::EventType;
using protocol::SessionEvent;

EventQueue::EventQueue(std::size_t capacity)
    : queue_(std::max<std::size_t>(1, capacity)) {}

void EventQueue::clear() noexcept {
    head_ = 0;
    tail_ = 0;
    count_ = 0;
    overflowed_ = false;
    overflowGeneration_ = 0;
    buffer_.clear();
}

bool EventQueue::push(const SessionEvent& ev) {
    if (overflowed_) return false;
    generation_++;
    if (count_ >= queue_.size()) {
        overflowed_ = true;
        overflowGeneration_ = generation_;
        head_ = 0;
        tail_ = 0;
        count_ = 0;
        return false;
    }
    queue_[tail_] = ev;
    tail_ = (tail_ + 1) % queue_.size();
    count_++;
    return true;
}

bool EventQueue::push(EventType type, std::uint32_t a, std::uint32_t b, std::uint32_t c, std::uint32_t d) {
    return push(SessionEvent{static_cast<std::uint16_t>(type), 0, a, b, c, d});
}

void EventQueue::recordWarning(ArError error, protocol::ErrorSource source) {
    ARPLACE_LOG_DEBUG("EventQueue: warning %s from source %u", arErrorName(error), static_cast<unsigned>(source));
    push(EventType::Warning, static_cast<std::uint32_t>(error), static_cast<std::uint32_t>(source));
}

EventBufferMeta EventQueue::poll(std::uint32_t maxEvents) {
    buffer_.clear();
    if (overflowed_) {
        buffer_.push_back(SessionEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            overflowGeneration_,
            0,
            0,
            0,
        });
        return EventBufferMeta{
            generation_,
            static_cast<std::uint32_t>(buffer_.size()),
            reinterpret_cast<std::uintptr_t>(buffer_.data()),
        };
    }

    if (count_ == 0 || maxEvents == 0) {
        return EventBufferMeta{generation_, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, count_);
    buffer_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        buffer_.push_back(queue_[head_]);
        head_ = (head_ + 1) % queue_.size();
        count_--;
    }

    return EventBufferMeta{
        generation_,
        static_cast<std::uint32_t>(buffer_.size()),
        reinterpret_cast<std::uintptr_t>(buffer_.data()),
    };
}

void EventQueue::ackResync(std::uint32_t resyncGeneration) {
    if (!overflowed_) return;
    if (resyncGeneration < overflowGeneration_) return;
    overflowed_ = false;
    overflowGeneration_ = 0;
    head_ = 0;
    tail_ = 0;
    count_ = 0;
}

} // namespace arplace
