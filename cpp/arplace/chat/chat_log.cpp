#include "arplace/chat/chat_log.h"
#include "arplace/core/logging.h"
#include "arplace/protocol/event_queue.h"

#include <algorithm>
#include <utility>

namespace arplace {

using protocol::EventType;

namespace {
constexpr const char* kWhitespace = " \t\r\n\v\f";

bool isContinuationByte(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}
} // namespace

std::string trimWhitespace(const std::string& text) {
    const std::size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return std::string();
    const std::size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::size_t utf8Length(const std::string& text) noexcept {
    std::size_t n = 0;
    for (unsigned char c : text) {
        if (!isContinuationByte(c)) n++;
    }
    return n;
}

std::string utf8Prefix(const std::string& text, std::size_t count) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isContinuationByte(static_cast<unsigned char>(text[i]))) {
            if (seen == count) return text.substr(0, i);
            seen++;
        }
    }
    return text;
}

ChatLog::ChatLog(ChatConfig config, EventQueue* events)
    : config_(std::move(config)), events_(events) {}

void ChatLog::append(ChatSender sender, const std::string& text, std::size_t revealed) {
    for (auto& m : messages_) m.offsetY += config_.messageSpacing;

    ChatMessage msg;
    msg.sender = sender;
    msg.text = text;
    msg.revealedChars = revealed;
    messages_.push_back(std::move(msg));
    scrollRequested_ = true;

    if (events_) {
        events_->push(EventType::ChatMessage, static_cast<std::uint32_t>(messages_.size() - 1), static_cast<std::uint32_t>(sender));
    }
}

bool ChatLog::send(const std::string& text) {
    const std::string message = trimWhitespace(text);
    if (message.empty()) return false;

    append(ChatSender::User, message, utf8Length(message));
    pending_.push_back(config_.botResponseDelay);
    ARPLACE_LOG_DEBUG("ChatLog: user message %zu queued a reply", messages_.size() - 1);
    return true;
}

void ChatLog::tick(float dt) {
    dt = std::max(0.0f, dt);

    for (auto& m : messages_) {
        if (m.sender != ChatSender::Bot) continue;
        const std::size_t total = utf8Length(m.text);
        if (m.revealedChars >= total) continue;
        m.typeElapsed += dt;
        if (config_.typewriterInterval <= 0.0f) {
            m.revealedChars = total;
        } else {
            const auto steps = static_cast<std::size_t>(m.typeElapsed / config_.typewriterInterval);
            m.revealedChars = std::min(total, steps);
        }
    }

    // Replies arrive in send order.
    std::size_t ready = 0;
    for (auto& remaining : pending_) {
        remaining -= dt;
        if (remaining <= 0.0f) ready++;
    }
    if (ready == 0) return;
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), [](float r) { return r <= 0.0f; }), pending_.end());
    for (std::size_t i = 0; i < ready; ++i) {
        append(ChatSender::Bot, config_.botResponseText, 0);
    }
}

void ChatLog::clear() {
    messages_.clear();
    pending_.clear();
    scrollRequested_ = false;
}

std::string ChatLog::visibleText(std::size_t index) const {
    if (index >= messages_.size()) return std::string();
    const ChatMessage& m = messages_[index];
    return utf8Prefix(m.text, m.revealedChars);
}

bool ChatLog::isTyping() const noexcept {
    return std::any_of(messages_.begin(), messages_.end(), [](const ChatMessage& m) {
        return m.sender == ChatSender::Bot && m.revealedChars < utf8Length(m.text);
    });
}

float ChatLog::contentHeight() const noexcept {
    return config_.baseContentHeight + static_cast<float>(messages_.size()) * config_.messageSpacing;
}

bool ChatLog::consumeScrollRequest() noexcept {
    const bool requested = scrollRequested_;
    scrollRequested_ = false;
    return requested;
}

} // namespace arplace
