#pragma once

/**
 * @file config.h
 * @brief Unified configuration system
 *
 * This file defines the configuration structure for the conversation core
 * and its reference collaborators. It supports:
 * - JSON file loading
 * - Environment variable overrides
 * - Default values
 * - Validation
 */

#include "types.h"
#include "constants.h"
#include <string>
#include <vector>

namespace avatar_tutor {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Chat-completions backend (Azure OpenAI deployment)
 */
struct LLMConfig {
    std::string endpoint;     ///< e.g. https://<resource>.openai.azure.com
    std::string api_key;      ///< Never written by save()
    std::string deployment;
    std::string api_version = constants::llm::CHAT_API_VERSION;
    std::string extensions_api_version = constants::llm::EXTENSIONS_API_VERSION;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    float temperature = constants::llm::DEFAULT_TEMPERATURE;
    int timeout_ms = constants::llm::DEFAULT_TIMEOUT_MS;
    int connect_timeout_ms = constants::llm::CONNECT_TIMEOUT_MS;
    int max_retries = constants::llm::DEFAULT_MAX_RETRIES;
    int retry_backoff_ms = constants::llm::DEFAULT_RETRY_BACKOFF_MS;
};

/**
 * @brief Retrieval data source ("on your data") attached to chat requests
 */
struct RetrievalConfig {
    bool enabled = false;
    std::string endpoint;
    std::string api_key;      ///< Never written by save()
    std::string index_name;
    std::string role_information;  ///< Filled from session.system_prompt when empty

    /// Enabled and fully specified
    bool is_usable() const {
        return enabled && !endpoint.empty() && !api_key.empty() && !index_name.empty();
    }
};

/**
 * @brief Conversation session behavior
 */
struct SessionConfig {
    std::string system_prompt = "You are an AI assistant that helps people find information.";
    /// Substituted for the assistant message of a failed turn
    std::string failure_message = "I apologize, but I'm having trouble connecting to the AI service. "
                                  "Please try again in a moment.";
    /// Also speak failure_message through the avatar
    bool speak_failure_message = true;
    /// Sentence terminals, each a single UTF-8 code point
    std::vector<std::string> sentence_terminals = {
        ".", "?", "!", ":", ";",
        "\xE3\x80\x82",  // 。
        "\xEF\xBC\x9F",  // ？
        "\xEF\xBC\x81",  // ！
        "\xEF\xBC\x9A",  // ：
        "\xEF\xBC\x9B"   // ；
    };
};

/**
 * @brief Avatar / console renderer settings
 */
struct SpeechConfig {
    std::string tts_voice = "en-US-AvaMultilingualNeural";
    std::string avatar_character = "lisa";
    std::string avatar_style = "casual";
    int words_per_minute = constants::speech::DEFAULT_WORDS_PER_MINUTE;
    int min_unit_ms = constants::speech::DEFAULT_MIN_UNIT_MS;
};

/**
 * @brief Logging settings
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

// =============================================================================
// Main Configuration
// =============================================================================

/**
 * @brief Complete application configuration
 */
struct AppConfig {
    LLMConfig llm;
    RetrievalConfig retrieval;
    SessionConfig session;
    SpeechConfig speech;
    LoggingConfig logging;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded config or error (not validated; call validate())
     */
    static Result<AppConfig> load(const std::string& path);

    /**
     * @brief Parse configuration from JSON text
     */
    static Result<AppConfig> parse(const std::string& json_text);

    /**
     * @brief Save configuration to JSON file (API keys are omitted)
     * @param path Path to save to
     * @return Success or error
     */
    VoidResult save(const std::string& path) const;

    /**
     * @brief Overlay AZURE_* and related environment variables
     */
    void apply_env_overrides();

    /**
     * @brief Create with default values
     */
    static AppConfig defaults();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace config

// Convenience alias
using Config = config::AppConfig;

} // namespace avatar_tutor
