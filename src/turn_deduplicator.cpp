#include "turn_deduplicator.h"
#include "utils.h"

namespace avatar_tutor {

const char* turn_decision_name(TurnDecision decision) {
    switch (decision) {
        case TurnDecision::Accept: return "accept";
        case TurnDecision::RejectEmpty: return "empty";
        case TurnDecision::RejectDuplicate: return "duplicate";
        case TurnDecision::RejectTurnInProgress: return "turn-in-progress";
    }
    return "unknown";
}

TurnDeduplicator::Verdict TurnDeduplicator::should_start_turn(
    InputChannel channel,
    const std::string& text,
    const std::optional<Turn>& current_turn)
{
    Verdict verdict;

    if (utils::is_empty_or_whitespace(text)) {
        verdict.decision = TurnDecision::RejectEmpty;
        return verdict;
    }

    auto it = last_accepted_.find(channel);
    if (it != last_accepted_.end() && it->second == text) {
        verdict.decision = TurnDecision::RejectDuplicate;
        return verdict;
    }

    if (current_turn && current_turn->in_progress()) {
        verdict.decision = TurnDecision::RejectTurnInProgress;
        return verdict;
    }

    last_accepted_[channel] = text;
    verdict.decision = TurnDecision::Accept;
    verdict.turn_id = next_turn_id_++;
    return verdict;
}

void TurnDeduplicator::on_turn_resolved() {
    last_accepted_.clear();
}

void TurnDeduplicator::reset() {
    last_accepted_.clear();
}

} // namespace avatar_tutor
