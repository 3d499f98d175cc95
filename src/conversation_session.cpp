#include "conversation_session.h"
#include "sentence_accumulator.h"
#include "turn_deduplicator.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace avatar_tutor {

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::Empty: return "empty";
        case RejectReason::Duplicate: return "duplicate";
        case RejectReason::TurnInProgress: return "turn-in-progress";
        case RejectReason::SessionInactive: return "session-inactive";
    }
    return "unknown";
}

Error SubmitResult::error() const {
    if (accepted) {
        return Error();
    }
    if (reason == RejectReason::SessionInactive) {
        return Error(ErrorType::InvalidState, "session is not active");
    }
    return Error(ErrorType::InputRejected, reject_reason_name(reason));
}

namespace {

RejectReason to_reject_reason(TurnDecision decision) {
    switch (decision) {
        case TurnDecision::RejectEmpty: return RejectReason::Empty;
        case TurnDecision::RejectDuplicate: return RejectReason::Duplicate;
        case TurnDecision::RejectTurnInProgress: return RejectReason::TurnInProgress;
        case TurnDecision::Accept: break;
    }
    return RejectReason::None;
}

std::string log_preview(const std::string& text) {
    return "\"" + utils::preview(text, constants::session::LOG_PREVIEW_CHARS) + "\"";
}

} // anonymous namespace

class ConversationSession::Impl {
public:
    Impl(const config::SessionConfig& config,
         IModelClient* model,
         IPlaybackSink* sink,
         const config::RetrievalConfig* retrieval)
        : config_(config)
        , model_(model)
        , accumulator_(config.sentence_terminals)
        , running_(true)
        , queue_(sink)
    {
        if (retrieval) {
            retrieval_ = *retrieval;
            if (retrieval_->role_information.empty()) {
                retrieval_->role_information = config_.system_prompt;
            }
        }
        queue_.set_idle_callback([this] { on_queue_idle(); });
        worker_ = std::thread(&Impl::worker_thread, this);
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            ++generation_;
            jobs_.clear();
        }
        jobs_cv_.notify_all();
        turn_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        queue_.set_idle_callback(nullptr);
        queue_.shutdown();
    }

    void start(bool retrieval_supplies_role_framing) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            LOG_SESSION("start ignored: session already active");
            return;
        }
        active_ = true;
        queue_.cancel_all();

        system_framed_ = !retrieval_supplies_role_framing;
        if (system_framed_ && history_.empty()) {
            append_locked(MessageRole::System, config_.system_prompt);
            LOG_SESSION("system message added");
        }
        LOG_SESSION(std::string("session started") +
                    (system_framed_ ? "" : " (role framing supplied by retrieval)"));
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_) {
                return;
            }
            active_ = false;
            abandon_turn_locked("session stopped");
            dedup_.reset();
            queue_.cancel_all();
            LOG_SESSION("session stopped");
        }
        turn_cv_.notify_all();
    }

    VoidResult clear_history() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_) {
                LOG_SESSION(std::string("clear ignored (") + error_type_name(ErrorType::InvalidState) +
                            "): session is not active");
                return VoidResult::failure("cannot clear history: session is not active");
            }
            abandon_turn_locked("history cleared");
            queue_.cancel_all();
            history_.clear();
            accumulator_.reset();
            dedup_.reset();
            if (system_framed_) {
                append_locked(MessageRole::System, config_.system_prompt);
            }
            LOG_SESSION("conversation history cleared");
        }
        turn_cv_.notify_all();
        return VoidResult::ok_result();
    }

    SubmitResult submit(InputChannel channel, const std::string& text) {
        uint64_t turn_id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_) {
                auto rejected = SubmitResult::Rejected(RejectReason::SessionInactive);
                LOG_INPUT(std::string("rejected ") + channel_name(channel) + " input (" +
                          error_type_name(rejected.error().type) + ": " + rejected.error().message + ")");
                return rejected;
            }

            auto verdict = dedup_.should_start_turn(channel, text, current_turn_);
            if (!verdict.accepted()) {
                auto rejected = SubmitResult::Rejected(to_reject_reason(verdict.decision));
                LOG_INPUT(std::string("rejected ") + channel_name(channel) + " input " +
                          log_preview(text) + " (" + error_type_name(rejected.error().type) + ": " +
                          turn_decision_name(verdict.decision) + ")");
                return rejected;
            }

            turn_id = verdict.turn_id;
            Turn turn;
            turn.turn_id = turn_id;
            turn.input_text = text;
            turn.input_channel = channel;
            turn.status = TurnStatus::Pending;
            current_turn_ = turn;

            stream_closed_ = false;
            reply_text_.clear();
            accumulator_.reset();

            append_locked(MessageRole::User, text);

            TurnJob job;
            job.turn_id = turn_id;
            job.generation = generation_;
            job.history = history_;
            jobs_.push_back(std::move(job));

            LOG_TRACE(turn_id, "accepted", std::string("channel=") + channel_name(channel) +
                      " text=" + log_preview(text));
        }
        jobs_cv_.notify_one();
        return SubmitResult::Accepted(turn_id);
    }

    bool is_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    std::vector<Message> history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_;
    }

    std::optional<Turn> current_turn() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_turn_;
    }

    std::string history_json() const {
        json messages = json::array();
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& msg : history_) {
            messages.push_back({
                {"role", role_name(msg.role)},
                {"content", msg.content},
                {"sequence", msg.sequence},
                {"created_at_ms", msg.created_at_ms}
            });
        }
        return messages.dump(2);
    }

    bool wait_for_turn(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto settled = [this] {
            return !running_ || !current_turn_ || !current_turn_->in_progress();
        };
        if (timeout_ms > 0) {
            return turn_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), settled);
        }
        turn_cv_.wait(lock, settled);
        return true;
    }

    SpeechQueue& speech_queue() {
        return queue_;
    }

private:
    struct TurnJob {
        uint64_t turn_id = 0;
        uint64_t generation = 0;
        std::vector<Message> history;
    };

    void worker_thread() {
        while (true) {
            TurnJob job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                jobs_cv_.wait(lock, [this] { return !jobs_.empty() || !running_; });
                if (!running_) {
                    break;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            run_turn(job);
        }
    }

    void run_turn(const TurnJob& job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_live_locked(job)) {
                return;
            }
            current_turn_->status = TurnStatus::Streaming;
        }
        LOG_TRACE(job.turn_id, "streaming", "history=" + std::to_string(job.history.size()));

        auto on_fragment = [this, &job](const std::string& fragment) -> bool {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_live_locked(job)) {
                return false;
            }
            reply_text_ += fragment;
            for (const auto& sentence : accumulator_.accept(fragment)) {
                enqueue_locked(sentence, job.turn_id);
            }
            return true;
        };

        // stop() and clear_history() abandon the turn without waiting on the backend
        auto should_abort = [this, &job]() -> bool {
            std::lock_guard<std::mutex> lock(mutex_);
            return !is_live_locked(job);
        };

        const config::RetrievalConfig* retrieval =
            (retrieval_ && retrieval_->is_usable()) ? &*retrieval_ : nullptr;

        Error err;
        try {
            err = model_->stream_reply(job.history, retrieval, on_fragment, should_abort);
        } catch (const std::exception& e) {
            err = make_error(ErrorType::StreamFailure, e.what());
        }

        finish_turn(job, err);
    }

    void finish_turn(const TurnJob& job, const Error& err) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_live_locked(job)) {
                // stop() or clear_history() already resolved this turn
                LOG_TRACE(job.turn_id, "discarded", std::string("result=") + error_type_name(err.type));
                return;
            }

            if (!err) {
                if (auto rest = accumulator_.flush()) {
                    enqueue_locked(*rest, job.turn_id);
                }
                append_locked(MessageRole::Assistant, reply_text_);
                stream_closed_ = true;
                LOG_TRACE(job.turn_id, "stream_closed", "chars=" + std::to_string(reply_text_.size()) +
                          " units=" + std::to_string(accumulator_.emitted_count()));
                if (queue_.is_idle()) {
                    complete_locked();
                }
            } else {
                fail_locked(err);
            }
        }
        turn_cv_.notify_all();
    }

    void on_queue_idle() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!current_turn_ || current_turn_->status != TurnStatus::Streaming || !stream_closed_) {
                return;
            }
            if (!queue_.is_idle()) {
                return;
            }
            complete_locked();
        }
        turn_cv_.notify_all();
    }

    void complete_locked() {
        current_turn_->status = TurnStatus::Complete;
        dedup_.on_turn_resolved();
        LOG_TRACE(current_turn_->turn_id, "complete", "");
    }

    void fail_locked(const Error& err) {
        const uint64_t turn_id = current_turn_->turn_id;
        current_turn_->status = TurnStatus::Failed;
        accumulator_.reset();
        stream_closed_ = false;
        dedup_.on_turn_resolved();

        // Backend status errors carry their own user-facing wording
        std::string apology = (err.type == ErrorType::HttpStatus && !err.message.empty())
            ? err.message
            : config_.failure_message;

        Logger::error("Turn " + std::to_string(turn_id) + " failed (" +
                      error_type_name(err.type) + "): " + err.message);
        append_locked(MessageRole::Assistant, apology);
        if (config_.speak_failure_message && !utils::is_empty_or_whitespace(apology)) {
            enqueue_locked(apology, turn_id);
        }
        LOG_TRACE(turn_id, "failed", std::string("error=") + error_type_name(err.type));
    }

    void abandon_turn_locked(const std::string& why) {
        ++generation_;
        jobs_.clear();
        stream_closed_ = false;
        reply_text_.clear();
        accumulator_.reset();
        if (current_turn_ && current_turn_->in_progress()) {
            current_turn_->status = TurnStatus::Failed;
            LOG_TRACE(current_turn_->turn_id, "aborted", why);
        }
    }

    bool is_live_locked(const TurnJob& job) const {
        return running_ && job.generation == generation_ && current_turn_ &&
               current_turn_->turn_id == job.turn_id && current_turn_->in_progress();
    }

    void enqueue_locked(const std::string& text, uint64_t turn_id) {
        // Whitespace-only pieces are part of the text but not worth speaking
        if (utils::is_empty_or_whitespace(text)) {
            return;
        }
        SpeakableUnit unit;
        unit.text = text;
        unit.turn_id = turn_id;
        unit.emitted_at = Clock::now();
        queue_.enqueue(std::move(unit));
    }

    void append_locked(MessageRole role, const std::string& content) {
        const uint64_t seq = next_sequence_++;
        switch (role) {
            case MessageRole::System:
                history_.push_back(Message::system(content, seq));
                break;
            case MessageRole::User:
                history_.push_back(Message::user(content, seq));
                break;
            case MessageRole::Assistant:
                history_.push_back(Message::assistant(content, seq));
                break;
        }
    }

    config::SessionConfig config_;
    IModelClient* model_;
    std::optional<config::RetrievalConfig> retrieval_;

    mutable std::mutex mutex_;
    std::condition_variable jobs_cv_;
    std::condition_variable turn_cv_;

    bool active_ = false;
    bool system_framed_ = false;
    std::vector<Message> history_;
    uint64_t next_sequence_ = 1;
    std::optional<Turn> current_turn_;
    SentenceAccumulator accumulator_;
    TurnDeduplicator dedup_;

    uint64_t generation_ = 0;  ///< Bumped whenever an in-flight turn is abandoned
    bool stream_closed_ = false;
    std::string reply_text_;

    std::deque<TurnJob> jobs_;
    bool running_;

    // Declared last: destroyed first, while the members above are still alive
    SpeechQueue queue_;
    std::thread worker_;
};

ConversationSession::ConversationSession(const config::SessionConfig& config,
                                         IModelClient* model,
                                         IPlaybackSink* sink,
                                         const config::RetrievalConfig* retrieval)
    : pimpl_(std::make_unique<Impl>(config, model, sink, retrieval)) {}

ConversationSession::~ConversationSession() = default;

void ConversationSession::start(bool retrieval_supplies_role_framing) {
    pimpl_->start(retrieval_supplies_role_framing);
}

void ConversationSession::stop() {
    pimpl_->stop();
}

VoidResult ConversationSession::clear_history() {
    return pimpl_->clear_history();
}

SubmitResult ConversationSession::submit(InputChannel channel, const std::string& text) {
    return pimpl_->submit(channel, text);
}

bool ConversationSession::is_active() const {
    return pimpl_->is_active();
}

std::vector<Message> ConversationSession::history() const {
    return pimpl_->history();
}

std::optional<Turn> ConversationSession::current_turn() const {
    return pimpl_->current_turn();
}

std::string ConversationSession::history_json() const {
    return pimpl_->history_json();
}

bool ConversationSession::wait_for_turn(int timeout_ms) {
    return pimpl_->wait_for_turn(timeout_ms);
}

SpeechQueue& ConversationSession::speech_queue() {
    return pimpl_->speech_queue();
}

} // namespace avatar_tutor
