#pragma once

/**
 * @file conversation_session.h
 * @brief Conversation turn orchestrator
 *
 * One ConversationSession per UI session. It is the single entry point for
 * typed and recognized-speech input and the single source of speakable
 * output. Lifecycle: created inactive, start(), stop(), optionally
 * clear_history() while active.
 *
 * Threading:
 * - submit() decides synchronously and returns at once; the model stream
 *   runs on the session's turn worker thread.
 * - Fragments flow worker -> SentenceAccumulator -> SpeechQueue; the
 *   renderer drains the queue on its own thread.
 * - Only one turn may be pending or streaming; others are rejected, never
 *   queued. A turn stays streaming until its speech has drained.
 */

#include "core/config.h"
#include "core/types.h"
#include "model_client.h"
#include "playback_sink.h"
#include "speech_queue.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace avatar_tutor {

enum class RejectReason {
    None,
    Empty,
    Duplicate,
    TurnInProgress,
    SessionInactive
};

const char* reject_reason_name(RejectReason reason);

/**
 * @brief Result of submit(): Accepted(turn_id) or Rejected(reason)
 */
struct SubmitResult {
    bool accepted = false;
    uint64_t turn_id = 0;
    RejectReason reason = RejectReason::None;

    static SubmitResult Accepted(uint64_t id) { return {true, id, RejectReason::None}; }
    static SubmitResult Rejected(RejectReason r) { return {false, 0, r}; }

    /// None when accepted; InvalidState for an inactive session, else InputRejected
    Error error() const;
};

class ConversationSession {
public:
    /**
     * @param config Session behavior
     * @param model Model-response client; must outlive the session
     * @param sink Renderer; must outlive the session
     * @param retrieval Data source passed to the model client (nullptr = none)
     */
    ConversationSession(const config::SessionConfig& config,
                        IModelClient* model,
                        IPlaybackSink* sink,
                        const config::RetrievalConfig* retrieval = nullptr);
    ~ConversationSession();

    // Non-copyable
    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    /**
     * @brief Activate the session
     * @param retrieval_supplies_role_framing True when the retrieval data
     *        source injects its own role framing; the system message is then
     *        not added to history
     */
    void start(bool retrieval_supplies_role_framing);

    /**
     * @brief Deactivate; cancels queued speech and abandons an in-flight turn.
     * History is kept.
     */
    void stop();

    /**
     * @brief Empty the history (system message re-added if start() added one)
     * @return Failure if the session is not active
     */
    VoidResult clear_history();

    /**
     * @brief Offer one input event
     * @return Accepted(turn_id), or Rejected(reason) without touching history
     */
    SubmitResult submit(InputChannel channel, const std::string& text);

    bool is_active() const;

    /// Snapshot of the transcript
    std::vector<Message> history() const;

    /// Snapshot of the most recent turn
    std::optional<Turn> current_turn() const;

    /// Transcript as a JSON array of {role, content, sequence, created_at_ms}
    std::string history_json() const;

    /**
     * @brief Block until no turn is pending or streaming
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if settled, false on timeout
     */
    bool wait_for_turn(int timeout_ms = 0);

    /// Queue the renderer reports completions to
    SpeechQueue& speech_queue();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace avatar_tutor
