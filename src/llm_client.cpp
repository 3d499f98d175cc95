#include "llm_client.h"
#include "logger.h"
#include "sse_stream_parser.h"
#include <curl/curl.h>
#include <chrono>
#include <sstream>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace avatar_tutor {

namespace {

/// Bytes of an error response body kept for the log
constexpr size_t MAX_ERROR_BODY = 2048;

/// Poll interval of the abandonment check during retry backoff (ms)
constexpr int ABORT_POLL_MS = 20;

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

// Failures worth another attempt when nothing has been delivered yet
bool is_retryable(const Error& err) {
    switch (err.type) {
        case ErrorType::NetworkError:
        case ErrorType::Timeout:
            return true;
        case ErrorType::HttpStatus:
            return err.http_status == 429 || err.http_status >= 500;
        default:
            return false;
    }
}

} // anonymous namespace

class AzureChatClient::Impl {
public:
    explicit Impl(const config::LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    std::string build_url(const config::RetrievalConfig* retrieval) const {
        std::string base = config_.endpoint;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        std::ostringstream url;
        url << base << "/openai/deployments/" << config_.deployment;
        if (retrieval) {
            url << "/extensions/chat/completions?api-version=" << config_.extensions_api_version;
        } else {
            url << "/chat/completions?api-version=" << config_.api_version;
        }
        return url.str();
    }

    std::string build_request_body(const std::vector<Message>& history,
                                   const config::RetrievalConfig* retrieval) const {
        json messages = json::array();
        for (const auto& msg : history) {
            messages.push_back({
                {"role", role_name(msg.role)},
                {"content", msg.content}
            });
        }

        json request;
        request["messages"] = messages;
        request["stream"] = true;
        request["max_tokens"] = config_.max_tokens;
        request["temperature"] = config_.temperature;

        if (retrieval) {
            json source;
            source["type"] = "azure_search";
            source["parameters"] = {
                {"endpoint", retrieval->endpoint},
                {"authentication", {{"type", "api_key"}, {"key", retrieval->api_key}}},
                {"index_name", retrieval->index_name},
                {"query_type", "simple"},
                {"in_scope", true},
                {"role_information", retrieval->role_information}
            };
            request["data_sources"] = json::array({source});
        }
        return request.dump();
    }

    Error stream_reply(const std::vector<Message>& history,
                       const config::RetrievalConfig* retrieval,
                       const FragmentCallback& on_fragment,
                       const AbortCheck& should_abort) {
        const std::string url = build_url(retrieval);
        const std::string body = build_request_body(history, retrieval);

        LOG_LLM("Calling URL: " + url);
        LOG_LLM(std::string("Using data sources: ") + (retrieval ? "true" : "false"));

        Error err;
        for (int attempt = 0; ; ++attempt) {
            size_t delivered = 0;
            err = perform(url, body, retrieval != nullptr, on_fragment, should_abort, delivered);
            if (!err) {
                return err;
            }
            if (delivered > 0 || attempt >= config_.max_retries || !is_retryable(err)) {
                break;
            }
            Logger::warn("Chat request failed (" + std::string(error_type_name(err.type)) +
                         "), retrying in " + std::to_string(config_.retry_backoff_ms) + " ms");
            if (!backoff(should_abort)) {
                LOG_LLM("Retry abandoned by consumer");
                return make_cancelled_error();
            }
        }
        return err;
    }

private:
    struct StreamState {
        CURL* curl = nullptr;
        SseStreamParser parser;
        const FragmentCallback* on_fragment = nullptr;
        const AbortCheck* should_abort = nullptr;
        size_t delivered = 0;
        bool cancelled = false;
        long status = 0;
        std::string error_body;

        explicit StreamState(bool all_choices) : parser(all_choices) {}
    };

    /// Sleep out the retry backoff; false if abandoned meanwhile
    bool backoff(const AbortCheck& should_abort) {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.retry_backoff_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (should_abort && should_abort()) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(ABORT_POLL_MS));
        }
        return !(should_abort && should_abort());
    }

    Error perform(const std::string& url, const std::string& body, bool all_choices,
                  const FragmentCallback& on_fragment, const AbortCheck& should_abort,
                  size_t& delivered) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        StreamState state(all_choices);
        state.curl = curl;
        state.on_fragment = &on_fragment;
        state.should_abort = &should_abort;

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, ("api-key: " + config_.api_key).c_str());

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        CURLcode res = curl_easy_perform(curl);
        if (state.status == 0) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &state.status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OK && is_success_status(state.status)) {
            deliver(state, state.parser.finish());
        }
        delivered = state.delivered;

        if (state.cancelled) {
            LOG_LLM("Stream abandoned by consumer after " + std::to_string(state.delivered) + " fragment(s)");
            return make_cancelled_error();
        }
        if (state.status != 0 && !is_success_status(state.status)) {
            Logger::error("API Error: " + std::to_string(state.status));
            if (!state.error_body.empty()) {
                Logger::error("Response: " + state.error_body);
            }
            return status_error(state.status);
        }
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error(std::string("Chat request timed out: ") + curl_easy_strerror(res));
        }
        if (res != CURLE_OK) {
            return make_network_error(std::string("Chat request failed: ") + curl_easy_strerror(res));
        }

        if (state.parser.malformed_count() > 0) {
            LOG_LLM("Skipped " + std::to_string(state.parser.malformed_count()) +
                    " malformed stream line(s), last: " + state.parser.last_error().message);
        }
        LOG_LLM("Stream complete: " + std::to_string(state.delivered) + " fragment(s)");
        return Error();
    }

    static void deliver(StreamState& state, const std::vector<std::string>& fragments) {
        for (const auto& fragment : fragments) {
            if (state.cancelled) {
                return;
            }
            ++state.delivered;
            if (!(*state.on_fragment)(fragment)) {
                state.cancelled = true;
            }
        }
    }

    // Called by libcurl about once a second even while idle, more often during transfer
    static int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* state = static_cast<StreamState*>(clientp);
        if (!state->cancelled && *state->should_abort && (*state->should_abort)()) {
            state->cancelled = true;
        }
        // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
        return state->cancelled ? 1 : 0;
    }

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        const size_t total = size * nmemb;
        auto* state = static_cast<StreamState*>(userp);

        if (state->status == 0) {
            curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &state->status);
        }

        std::string chunk(static_cast<const char*>(contents), total);
        if (!is_success_status(state->status)) {
            if (state->error_body.size() < MAX_ERROR_BODY) {
                state->error_body += chunk.substr(0, MAX_ERROR_BODY - state->error_body.size());
            }
            return total;
        }

        deliver(*state, state->parser.feed(chunk));
        // Returning less than total aborts the transfer
        return state->cancelled ? 0 : total;
    }

    config::LLMConfig config_;
};

AzureChatClient::AzureChatClient(const config::LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

AzureChatClient::~AzureChatClient() = default;

Error AzureChatClient::stream_reply(const std::vector<Message>& history,
                                    const config::RetrievalConfig* retrieval,
                                    const FragmentCallback& on_fragment,
                                    const AbortCheck& should_abort) {
    return pimpl_->stream_reply(history, retrieval, on_fragment, should_abort);
}

std::string AzureChatClient::build_url(const config::RetrievalConfig* retrieval) const {
    return pimpl_->build_url(retrieval);
}

std::string AzureChatClient::build_request_body(const std::vector<Message>& history,
                                                const config::RetrievalConfig* retrieval) const {
    return pimpl_->build_request_body(history, retrieval);
}

Error AzureChatClient::status_error(long status) {
    switch (status) {
        case 401:
            return make_http_error(status, "Authentication failed. Please check your API key in the configuration.");
        case 404:
            return make_http_error(status, "Deployment not found. Please verify your Azure OpenAI deployment name in the configuration.");
        case 429:
            return make_http_error(status, "Rate limit exceeded. Please wait a moment and try again.");
        default:
            return make_http_error(status, "I apologize, but I'm having trouble connecting to the AI service. "
                                           "Please check your configuration.");
    }
}

} // namespace avatar_tutor
