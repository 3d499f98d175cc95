/**
 * @file types.cpp
 * @brief Implementation of core type helper functions
 */

#include "core/types.h"

namespace avatar_tutor {

Message Message::system(const std::string& content, uint64_t sequence) {
    Message msg;
    msg.role = MessageRole::System;
    msg.content = content;
    msg.sequence = sequence;
    msg.created_at_ms = now_ms();
    return msg;
}

Message Message::user(const std::string& content, uint64_t sequence) {
    Message msg;
    msg.role = MessageRole::User;
    msg.content = content;
    msg.sequence = sequence;
    msg.created_at_ms = now_ms();
    return msg;
}

Message Message::assistant(const std::string& content, uint64_t sequence) {
    Message msg;
    msg.role = MessageRole::Assistant;
    msg.content = content;
    msg.sequence = sequence;
    msg.created_at_ms = now_ms();
    return msg;
}

const char* role_name(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "unknown";
}

const char* channel_name(InputChannel channel) {
    switch (channel) {
        case InputChannel::Typed: return "typed";
        case InputChannel::Voice: return "voice";
    }
    return "unknown";
}

const char* turn_status_name(TurnStatus status) {
    switch (status) {
        case TurnStatus::Pending: return "pending";
        case TurnStatus::Streaming: return "streaming";
        case TurnStatus::Complete: return "complete";
        case TurnStatus::Failed: return "failed";
    }
    return "unknown";
}

} // namespace avatar_tutor
