/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace avatar_tutor {
namespace config {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

LLMConfig parse_llm_config(const json& j) {
    LLMConfig config;
    if (!j.contains("llm")) return config;

    const auto& llm = j["llm"];
    config.endpoint = get_or_default(llm, "endpoint", config.endpoint);
    config.api_key = get_or_default(llm, "api_key", config.api_key);
    config.deployment = get_or_default(llm, "deployment", config.deployment);
    config.api_version = get_or_default(llm, "api_version", config.api_version);
    config.extensions_api_version = get_or_default(llm, "extensions_api_version", config.extensions_api_version);
    config.max_tokens = get_or_default(llm, "max_tokens", config.max_tokens);
    config.temperature = get_or_default(llm, "temperature", config.temperature);
    config.timeout_ms = get_or_default(llm, "timeout_ms", config.timeout_ms);
    config.connect_timeout_ms = get_or_default(llm, "connect_timeout_ms", config.connect_timeout_ms);
    config.max_retries = get_or_default(llm, "max_retries", config.max_retries);
    config.retry_backoff_ms = get_or_default(llm, "retry_backoff_ms", config.retry_backoff_ms);
    return config;
}

RetrievalConfig parse_retrieval_config(const json& j) {
    RetrievalConfig config;
    if (!j.contains("retrieval")) return config;

    const auto& r = j["retrieval"];
    config.enabled = get_or_default(r, "enabled", config.enabled);
    config.endpoint = get_or_default(r, "endpoint", config.endpoint);
    config.api_key = get_or_default(r, "api_key", config.api_key);
    config.index_name = get_or_default(r, "index_name", config.index_name);
    config.role_information = get_or_default(r, "role_information", config.role_information);
    return config;
}

SessionConfig parse_session_config(const json& j) {
    SessionConfig config;
    if (!j.contains("session")) return config;

    const auto& s = j["session"];
    config.system_prompt = get_or_default(s, "system_prompt", config.system_prompt);
    config.failure_message = get_or_default(s, "failure_message", config.failure_message);
    config.speak_failure_message = get_or_default(s, "speak_failure_message", config.speak_failure_message);
    config.sentence_terminals = get_array_or_default<std::string>(s, "sentence_terminals", config.sentence_terminals);
    return config;
}

SpeechConfig parse_speech_config(const json& j) {
    SpeechConfig config;
    if (!j.contains("speech")) return config;

    const auto& s = j["speech"];
    config.tts_voice = get_or_default(s, "tts_voice", config.tts_voice);
    config.avatar_character = get_or_default(s, "avatar_character", config.avatar_character);
    config.avatar_style = get_or_default(s, "avatar_style", config.avatar_style);
    config.words_per_minute = get_or_default(s, "words_per_minute", config.words_per_minute);
    config.min_unit_ms = get_or_default(s, "min_unit_ms", config.min_unit_ms);
    return config;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    if (!j.contains("logging")) return config;

    const auto& l = j["logging"];
    config.level = get_or_default(l, "level", config.level);
    config.file = get_or_default(l, "file", config.file);
    return config;
}

json llm_config_to_json(const LLMConfig& config) {
    return {
        {"endpoint", config.endpoint},
        {"deployment", config.deployment},
        {"api_version", config.api_version},
        {"extensions_api_version", config.extensions_api_version},
        {"max_tokens", config.max_tokens},
        {"temperature", config.temperature},
        {"timeout_ms", config.timeout_ms},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"max_retries", config.max_retries},
        {"retry_backoff_ms", config.retry_backoff_ms}
    };
}

json retrieval_config_to_json(const RetrievalConfig& config) {
    return {
        {"enabled", config.enabled},
        {"endpoint", config.endpoint},
        {"index_name", config.index_name},
        {"role_information", config.role_information}
    };
}

json session_config_to_json(const SessionConfig& config) {
    return {
        {"system_prompt", config.system_prompt},
        {"failure_message", config.failure_message},
        {"speak_failure_message", config.speak_failure_message},
        {"sentence_terminals", config.sentence_terminals}
    };
}

json speech_config_to_json(const SpeechConfig& config) {
    return {
        {"tts_voice", config.tts_voice},
        {"avatar_character", config.avatar_character},
        {"avatar_style", config.avatar_style},
        {"words_per_minute", config.words_per_minute},
        {"min_unit_ms", config.min_unit_ms}
    };
}

json logging_config_to_json(const LoggingConfig& config) {
    return {
        {"level", config.level},
        {"file", config.file}
    };
}

void override_string(const char* var, std::string& target) {
    const char* v = std::getenv(var);
    if (v && *v) {
        target = v;
    }
}

void override_bool(const char* var, bool& target) {
    const char* v = std::getenv(var);
    if (!v || !*v) return;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    target = (s == "true" || s == "1" || s == "yes");
}

AppConfig from_json(const json& j) {
    AppConfig config;
    config.llm = parse_llm_config(j);
    config.retrieval = parse_retrieval_config(j);
    config.session = parse_session_config(j);
    config.speech = parse_speech_config(j);
    config.logging = parse_logging_config(j);
    return config;
}

} // anonymous namespace

// =============================================================================
// AppConfig Implementation
// =============================================================================

Result<AppConfig> AppConfig::load(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Result<AppConfig>::failure("Failed to open config file: " + path);
        }

        json j = json::parse(file);
        AppConfig config = from_json(j);

        Logger::info("Configuration loaded from: " + path);
        return Result<AppConfig>::success(std::move(config));

    } catch (const json::exception& e) {
        return Result<AppConfig>::failure(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return Result<AppConfig>::failure(std::string("Error loading config: ") + e.what());
    }
}

Result<AppConfig> AppConfig::parse(const std::string& json_text) {
    try {
        return Result<AppConfig>::success(from_json(json::parse(json_text)));
    } catch (const json::exception& e) {
        return Result<AppConfig>::failure(std::string("JSON parse error: ") + e.what());
    }
}

VoidResult AppConfig::save(const std::string& path) const {
    try {
        json j;

        j["llm"] = llm_config_to_json(llm);
        j["retrieval"] = retrieval_config_to_json(retrieval);
        j["session"] = session_config_to_json(session);
        j["speech"] = speech_config_to_json(speech);
        j["logging"] = logging_config_to_json(logging);

        std::ofstream file(path);
        if (!file.is_open()) {
            return VoidResult::failure("Failed to open file for writing: " + path);
        }

        file << j.dump(2);
        Logger::info("Configuration saved to: " + path);
        return VoidResult::ok_result();

    } catch (const std::exception& e) {
        return VoidResult::failure(std::string("Error saving config: ") + e.what());
    }
}

void AppConfig::apply_env_overrides() {
    override_string("AZURE_OPENAI_ENDPOINT", llm.endpoint);
    override_string("AZURE_OPENAI_KEY", llm.api_key);
    override_string("AZURE_OPENAI_DEPLOYMENT", llm.deployment);
    override_string("AZURE_OPENAI_API_VERSION", llm.api_version);

    override_string("AZURE_SEARCH_ENDPOINT", retrieval.endpoint);
    override_string("AZURE_SEARCH_KEY", retrieval.api_key);
    override_string("AZURE_SEARCH_INDEX", retrieval.index_name);
    override_bool("ENABLE_AZURE_SEARCH", retrieval.enabled);

    override_string("SYSTEM_PROMPT", session.system_prompt);

    override_string("TTS_VOICE", speech.tts_voice);
    override_string("AVATAR_CHARACTER", speech.avatar_character);
    override_string("AVATAR_STYLE", speech.avatar_style);
}

AppConfig AppConfig::defaults() {
    return AppConfig{};  // All defaults are set in struct definitions
}

std::string AppConfig::validate() const {
    std::ostringstream errors;

    // Validate LLM
    if (llm.endpoint.empty()) {
        errors << "llm.endpoint is required; ";
    }
    if (llm.api_key.empty()) {
        errors << "llm.api_key is required; ";
    }
    if (llm.deployment.empty()) {
        errors << "llm.deployment is required; ";
    }
    if (llm.temperature < 0.0f || llm.temperature > 2.0f) {
        errors << "llm.temperature must be between 0 and 2; ";
    }
    if (llm.max_tokens <= 0) {
        errors << "llm.max_tokens must be positive; ";
    }
    if (llm.timeout_ms <= 0) {
        errors << "llm.timeout_ms must be positive; ";
    }
    if (llm.max_retries < 0) {
        errors << "llm.max_retries must not be negative; ";
    }

    // Validate session
    if (session.sentence_terminals.empty()) {
        errors << "session.sentence_terminals must not be empty; ";
    }

    // Validate speech
    if (speech.words_per_minute <= 0) {
        errors << "speech.words_per_minute must be positive; ";
    }

    return errors.str();
}

} // namespace config
} // namespace avatar_tutor
