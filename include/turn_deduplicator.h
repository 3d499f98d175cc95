#pragma once

#include "core/types.h"
#include <map>
#include <optional>
#include <string>

namespace avatar_tutor {

/**
 * @brief Outcome of a dedup check
 */
enum class TurnDecision {
    Accept,
    RejectEmpty,
    RejectDuplicate,
    RejectTurnInProgress
};

const char* turn_decision_name(TurnDecision decision);

/**
 * @brief Decides whether an input event starts a new turn
 *
 * Checks run in order: empty/whitespace text, exact repeat of the last
 * accepted text on the same channel inside the dedup window, then a turn
 * still pending or streaming. The window opens when a turn is accepted and
 * closes when a turn resolves (complete or failed).
 *
 * Only the most recent accepted text per channel is remembered, so a voice
 * channel alternating between two phrases is not caught.
 *
 * Not thread-safe; the owning session serializes access.
 */
class TurnDeduplicator {
public:
    struct Verdict {
        TurnDecision decision = TurnDecision::RejectEmpty;
        uint64_t turn_id = 0;  ///< Allocated only on Accept

        bool accepted() const { return decision == TurnDecision::Accept; }
    };

    TurnDeduplicator() = default;

    /**
     * @brief Check an input event against the current turn
     * @param channel Input source
     * @param text Raw input text
     * @param current_turn Most recent turn, if any
     * @return Verdict; on Accept a fresh monotonic turn_id is allocated and
     *         text becomes the remembered input for channel
     */
    Verdict should_start_turn(InputChannel channel,
                              const std::string& text,
                              const std::optional<Turn>& current_turn);

    /// Close the dedup window after a turn reaches complete or failed
    void on_turn_resolved();

    /// Forget remembered inputs; turn ids keep increasing
    void reset();

    uint64_t last_turn_id() const { return next_turn_id_ - 1; }

private:
    std::map<InputChannel, std::string> last_accepted_;
    uint64_t next_turn_id_ = 1;
};

} // namespace avatar_tutor
