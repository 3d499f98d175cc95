#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the avatar_tutor conversation core
 *
 * This file contains all fundamental types used throughout the system.
 * Keeping types centralized ensures consistency and makes refactoring easier.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <functional>
#include <optional>

namespace avatar_tutor {

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Get milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock timestamp in milliseconds since the epoch (for transcripts and logs)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Result Types (for error handling without exceptions)
// =============================================================================

/// Generic result type for operations that can fail
template<typename T>
struct Result {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }
    bool failed() const { return !ok(); }

    static Result success(T val) { return {std::move(val), ""}; }
    static Result failure(std::string err) { return {std::nullopt, std::move(err)}; }
};

/// Void result for operations that don't return a value
struct VoidResult {
    bool success;
    std::string error;

    bool ok() const { return success; }
    bool failed() const { return !ok(); }

    static VoidResult ok_result() { return {true, ""}; }
    static VoidResult failure(std::string err) { return {false, std::move(err)}; }
};

// =============================================================================
// Conversation Types
// =============================================================================

/// Conversation message roles
enum class MessageRole {
    System,
    User,
    Assistant
};

/// Where a user input came from
enum class InputChannel {
    Typed,
    Voice
};

/// Lifecycle of one request/response exchange
enum class TurnStatus {
    Pending,    ///< Accepted, model stream not yet open
    Streaming,  ///< Model stream open, or closed with speech still draining
    Complete,   ///< Stream closed and speech queue drained
    Failed      ///< Stream failed or the turn was abandoned
};

/// Single immutable entry in the session transcript
struct Message {
    MessageRole role = MessageRole::User;
    std::string content;
    uint64_t sequence = 0;      ///< Monotonic per session, never reused
    int64_t created_at_ms = 0;  ///< Wall clock

    static Message system(const std::string& content, uint64_t sequence);
    static Message user(const std::string& content, uint64_t sequence);
    static Message assistant(const std::string& content, uint64_t sequence);
};

/// Smallest chunk of assistant text handed to the renderer as one playback request
struct SpeakableUnit {
    std::string text;
    uint64_t turn_id = 0;
    uint64_t unit_id = 0;       ///< Assigned by SpeechQueue on enqueue
    TimePoint emitted_at;
};

/// One conversational turn
struct Turn {
    uint64_t turn_id = 0;
    std::string input_text;
    InputChannel input_channel = InputChannel::Typed;
    TurnStatus status = TurnStatus::Pending;

    /// True while the turn blocks new submissions
    bool in_progress() const {
        return status == TurnStatus::Pending || status == TurnStatus::Streaming;
    }
};

const char* role_name(MessageRole role);
const char* channel_name(InputChannel channel);
const char* turn_status_name(TurnStatus status);

// =============================================================================
// Callback Types
// =============================================================================

/// Model fragment callback; return false to abandon the stream
using FragmentCallback = std::function<bool(const std::string& fragment)>;

/// Polled by a model client while it waits on the backend; true means stop now
using AbortCheck = std::function<bool()>;

/// Fired when the speech queue goes from busy to idle
using IdleCallback = std::function<void()>;

} // namespace avatar_tutor
