#pragma once

#include "arplace/core/types.h"
#include "arplace/protocol/protocol_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace arplace {

// Fixed-capacity ring of session events. On overflow the queue drops everything
// and reports a single Overflow event until the host acknowledges it.
class EventQueue {
public:
    static constexpr std::size_t kDefaultCapacity = 512;

    explicit EventQueue(std::size_t capacity = kDefaultCapacity);

    bool push(const protocol::SessionEvent& ev);
    bool push(protocol::EventType type, std::uint32_t a = 0, std::uint32_t b = 0, std::uint32_t c = 0, std::uint32_t d = 0);
    void recordWarning(ArError error, protocol::ErrorSource source);

    protocol::EventBufferMeta poll(std::uint32_t maxEvents);
    const std::vector<protocol::SessionEvent>& lastPolled() const noexcept { return buffer_; }
    void ackResync(std::uint32_t generation);

    void clear() noexcept;
    std::size_t size() const noexcept { return count_; }
    std::size_t capacity() const noexcept { return queue_.size(); }
    bool overflowed() const noexcept { return overflowed_; }
    std::uint32_t generation() const noexcept { return generation_; }

private:
    std::vector<protocol::SessionEvent> queue_;
    std::vector<protocol::SessionEvent> buffer_;
    std::size_t head_ = 0;
    std::size_t tail_ = 0;
    std::size_t count_ = 0;
    bool overflowed_ = false;
    std::uint32_t overflowGeneration_ = 0;
    std::uint32_t generation_ = 0;
};

} // namespace arplace
