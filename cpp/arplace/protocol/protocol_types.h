#pragma once

#include <cstdint>

namespace arplace::protocol {

enum class EventType : std::uint16_t {
    Overflow = 1,
    Warning = 2,          // a = ArError, b = ErrorSource
    ObjectPlaced = 3,     // a = object id, b = asset index
    ObjectCleared = 4,    // a = object id, b = asset index
    LockChanged = 5,      // a = 1 locked / 0 unlocked, b = lock cycle
    ScreenChanged = 6,    // a = previous screen, b = current screen
    BackAtRoot = 7,       // a = current screen
    QuizAnswered = 8,     // a = question index, b = 1 correct / 0 wrong, c = score, d = 1 on time-up
    QuizFinished = 9,     // a = score, b = correct answers, c = question count
    ChatMessage = 10,     // a = message index, b = ChatSender
};

enum class ErrorSource : std::uint32_t {
    Session = 0,
    SurfaceLocator = 1,
    Placer = 2,
    Navigator = 3,
    Quiz = 4,
    Chat = 5,
};

// POD record copied out to the host in poll order.
struct SessionEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

} // namespace arplace::protocol
