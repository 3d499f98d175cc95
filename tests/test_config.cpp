/**
 * Configuration tests.
 * Asserts:
 * - Missing sections fall back to defaults; present keys override them.
 * - validate() reports every problem; save() never writes API keys.
 * - Environment variables override file values.
 *
 * Run from build dir: ./test_config
 */

#include "core/config.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace avatar_tutor;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- Defaults ---
    {
        Config config = Config::defaults();
        ASSERT(config.llm.max_tokens == 800);
        ASSERT(config.llm.temperature > 0.69f && config.llm.temperature < 0.71f);
        ASSERT(config.llm.api_version == "2024-08-01-preview");
        ASSERT(config.llm.extensions_api_version == "2024-02-15-preview");
        ASSERT(config.session.system_prompt == "You are an AI assistant that helps people find information.");
        ASSERT(config.session.sentence_terminals.size() == 10);
        ASSERT(config.session.speak_failure_message);
        ASSERT(!config.retrieval.enabled);
        ASSERT(!config.retrieval.is_usable());
        ASSERT(config.logging.level == "info");

        // Credentials are required
        std::string problems = config.validate();
        ASSERT(problems.find("llm.endpoint") != std::string::npos);
        ASSERT(problems.find("llm.api_key") != std::string::npos);
        ASSERT(problems.find("llm.deployment") != std::string::npos);
    }

    // --- Parse with overrides ---
    {
        auto result = Config::parse(R"({
            "llm": {"endpoint": "https://tutor.openai.azure.com", "api_key": "k", "deployment": "gpt-4o",
                    "max_tokens": 256, "max_retries": 3},
            "retrieval": {"enabled": true, "endpoint": "https://s.search.windows.net", "api_key": "sk",
                          "index_name": "lessons"},
            "session": {"system_prompt": "You are a patient tutor.", "speak_failure_message": false,
                        "sentence_terminals": [".", "?"]},
            "logging": {"level": "debug"}
        })");
        ASSERT(result.ok());
        if (result.ok()) {
            const Config& config = *result.value;
            ASSERT(config.llm.deployment == "gpt-4o");
            ASSERT(config.llm.max_tokens == 256);
            ASSERT(config.llm.max_retries == 3);
            ASSERT(config.llm.timeout_ms == 30000);
            ASSERT(config.retrieval.is_usable());
            ASSERT(config.session.system_prompt == "You are a patient tutor.");
            ASSERT(!config.session.speak_failure_message);
            ASSERT(config.session.sentence_terminals.size() == 2);
            ASSERT(config.speech.words_per_minute == 160);
            ASSERT(config.logging.level == "debug");
            ASSERT(config.validate().empty());
        }
    }

    // --- Bad input ---
    {
        ASSERT(Config::parse("{ not json").failed());
        ASSERT(Config::load("/nonexistent/avatar_tutor.json").failed());

        Config config = Config::defaults();
        config.llm.endpoint = "e";
        config.llm.api_key = "k";
        config.llm.deployment = "d";
        config.llm.temperature = 3.0f;
        config.session.sentence_terminals.clear();
        config.speech.words_per_minute = 0;
        std::string problems = config.validate();
        ASSERT(problems.find("llm.temperature") != std::string::npos);
        ASSERT(problems.find("session.sentence_terminals") != std::string::npos);
        ASSERT(problems.find("speech.words_per_minute") != std::string::npos);
        ASSERT(problems.find("llm.endpoint") == std::string::npos);
    }

    // --- save() round trip without secrets ---
    {
        const std::string path = "test_config_saved.json";
        Config config = Config::defaults();
        config.llm.endpoint = "https://tutor.openai.azure.com";
        config.llm.api_key = "secret-llm-key";
        config.llm.deployment = "gpt-4o";
        config.retrieval.api_key = "secret-search-key";
        config.speech.avatar_character = "harry";
        ASSERT(config.save(path).ok());

        std::ifstream in(path);
        std::stringstream text;
        text << in.rdbuf();
        ASSERT(text.str().find("secret-llm-key") == std::string::npos);
        ASSERT(text.str().find("secret-search-key") == std::string::npos);

        auto loaded = Config::load(path);
        ASSERT(loaded.ok());
        if (loaded.ok()) {
            ASSERT(loaded.value->llm.deployment == "gpt-4o");
            ASSERT(loaded.value->llm.api_key.empty());
            ASSERT(loaded.value->speech.avatar_character == "harry");
        }
        std::remove(path.c_str());
    }

    // --- Environment overrides ---
    {
        setenv("AZURE_OPENAI_ENDPOINT", "https://env.openai.azure.com", 1);
        setenv("AZURE_OPENAI_KEY", "env-key", 1);
        setenv("AZURE_SEARCH_INDEX", "env-index", 1);
        setenv("ENABLE_AZURE_SEARCH", "True", 1);
        setenv("SYSTEM_PROMPT", "", 1);

        Config config = Config::defaults();
        config.apply_env_overrides();
        ASSERT(config.llm.endpoint == "https://env.openai.azure.com");
        ASSERT(config.llm.api_key == "env-key");
        ASSERT(config.retrieval.index_name == "env-index");
        ASSERT(config.retrieval.enabled);
        // Empty variables leave the value alone
        ASSERT(config.session.system_prompt == "You are an AI assistant that helps people find information.");

        unsetenv("AZURE_OPENAI_ENDPOINT");
        unsetenv("AZURE_OPENAI_KEY");
        unsetenv("AZURE_SEARCH_INDEX");
        unsetenv("ENABLE_AZURE_SEARCH");
        unsetenv("SYSTEM_PROMPT");
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
