#pragma once

#include "arplace/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arplace {

class EventQueue;

enum class ChatSender : std::uint8_t {
    User = 0,
    Bot = 1,
};

struct ChatMessage {
    ChatSender sender{ChatSender::User};
    std::string text;
    std::size_t revealedChars{0};  // code points shown by the typewriter
    float offsetY{0.0f};           // upward shift from later messages
    float typeElapsed{0.0f};
};

struct ChatConfig {
    float botResponseDelay{1.5f};
    float typewriterInterval{0.05f};
    std::string botResponseText{"Hello this is SanskARI BOT to help you with your questions"};
    float messageSpacing{80.0f};
    float baseContentHeight{100.0f};
};

// Scripted chat: every user message gets the configured bot reply after a delay.
class ChatLog {
public:
    explicit ChatLog(ChatConfig config = {}, EventQueue* events = nullptr);

    // Trims the input; whitespace-only text is ignored.
    bool send(const std::string& text);
    void tick(float dt);
    // Drops all messages and any reply still waiting.
    void clear();

    const std::vector<ChatMessage>& messages() const noexcept { return messages_; }
    std::size_t messageCount() const noexcept { return messages_.size(); }
    std::string visibleText(std::size_t index) const;
    bool isTyping() const noexcept;
    std::size_t pendingReplies() const noexcept { return pending_.size(); }
    float contentHeight() const noexcept;
    bool consumeScrollRequest() noexcept;
    const ChatConfig& config() const noexcept { return config_; }

private:
    void append(ChatSender sender, const std::string& text, std::size_t revealed);

    ChatConfig config_;
    EventQueue* events_;
    std::vector<ChatMessage> messages_;
    std::vector<float> pending_;  // seconds until each queued reply
    bool scrollRequested_ = false;
};

std::string trimWhitespace(const std::string& text);
std::size_t utf8Length(const std::string& text) noexcept;
// Leading `count` code points of `text`.
std::string utf8Prefix(const std::string& text, std::size_t count);

} // namespace arplace
