#pragma once

#include "core/config.h"
#include "model_client.h"
#include <memory>
#include <string>
#include <vector>

namespace avatar_tutor {

/**
 * @brief Streaming chat-completions client for an Azure OpenAI deployment
 *
 * Sends the transcript with "stream": true and forwards each content delta
 * to the caller as it arrives. When a usable retrieval data source is given,
 * the extensions endpoint is used and the data source is attached to the
 * request.
 */
class AzureChatClient : public IModelClient {
public:
    explicit AzureChatClient(const config::LLMConfig& config);
    ~AzureChatClient() override;

    // Non-copyable
    AzureChatClient(const AzureChatClient&) = delete;
    AzureChatClient& operator=(const AzureChatClient&) = delete;

    Error stream_reply(const std::vector<Message>& history,
                       const config::RetrievalConfig* retrieval,
                       const FragmentCallback& on_fragment,
                       const AbortCheck& should_abort) override;

    /**
     * @brief Request URL for the given retrieval setting
     */
    std::string build_url(const config::RetrievalConfig* retrieval) const;

    /**
     * @brief Request body as JSON text
     */
    std::string build_request_body(const std::vector<Message>& history,
                                   const config::RetrievalConfig* retrieval) const;

    /**
     * @brief User-facing error for a non-success HTTP status
     */
    static Error status_error(long status);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace avatar_tutor
