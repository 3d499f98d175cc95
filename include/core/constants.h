#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * All magic numbers should be defined here with clear documentation.
 * This makes tuning the system behavior straightforward.
 */

#include <cstddef>

namespace avatar_tutor {
namespace constants {

// =============================================================================
// LLM (Language Model) Constants
// =============================================================================

namespace llm {
    /// Default timeout for a whole streamed request (ms)
    constexpr int DEFAULT_TIMEOUT_MS = 30000;

    /// Connection timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 5000;

    /// Default max tokens in response
    constexpr int DEFAULT_MAX_TOKENS = 800;

    /// Default temperature
    constexpr float DEFAULT_TEMPERATURE = 0.7f;

    /// Connection-level retries before the first fragment arrives
    constexpr int DEFAULT_MAX_RETRIES = 1;

    /// Spacing between those retries (ms)
    constexpr int DEFAULT_RETRY_BACKOFF_MS = 500;

    constexpr const char* CHAT_API_VERSION = "2024-08-01-preview";
    constexpr const char* EXTENSIONS_API_VERSION = "2024-02-15-preview";
}

// =============================================================================
// Session Constants
// =============================================================================

namespace session {
    /// Characters of user text kept when logging
    constexpr size_t LOG_PREVIEW_CHARS = 50;
}

// =============================================================================
// Speech / Renderer Constants
// =============================================================================

namespace speech {
    /// Simulated speaking rate of the console renderer
    constexpr int DEFAULT_WORDS_PER_MINUTE = 160;

    /// Floor on the simulated duration of one unit (ms)
    constexpr int DEFAULT_MIN_UNIT_MS = 300;
}

} // namespace constants
} // namespace avatar_tutor
