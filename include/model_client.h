#pragma once

/**
 * @file model_client.h
 * @brief Model-response collaborator consumed by the conversation session
 *
 * The session only sees fragments in arrival order and one terminal signal.
 * Wire protocol, authentication and retry policy live behind this interface.
 */

#include "core/config.h"
#include "core/types.h"
#include "errors.h"
#include <vector>

namespace avatar_tutor {

class IModelClient {
public:
    virtual ~IModelClient() = default;

    /**
     * @brief Stream a reply to the given history
     *
     * Blocks the calling thread until the stream ends. on_fragment is called
     * on that same thread for every non-empty fragment, in order; returning
     * false asks the client to abandon the stream.
     *
     * should_abort is polled while no fragment is arriving (connecting,
     * waiting on the backend, between retries). Once it returns true the
     * client must give up promptly and return Cancelled.
     *
     * @param history Ordered transcript, oldest first
     * @param retrieval Data source to attach, or nullptr
     * @param on_fragment Fragment consumer
     * @param should_abort Abandonment check (may be empty)
     * @return Error with type None on completion; Cancelled when the consumer
     *         abandoned the stream; any other type is a stream failure
     */
    virtual Error stream_reply(const std::vector<Message>& history,
                               const config::RetrievalConfig* retrieval,
                               const FragmentCallback& on_fragment,
                               const AbortCheck& should_abort) = 0;
};

} // namespace avatar_tutor
