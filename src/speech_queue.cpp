#include "speech_queue.h"
#include "logger.h"
#include "utils.h"
#include <chrono>

namespace avatar_tutor {

SpeechQueue::SpeechQueue(IPlaybackSink* sink)
    : sink_(sink), running_(true), dispatched_count_(0) {
    dispatcher_ = std::thread(&SpeechQueue::dispatcher_thread, this);
}

SpeechQueue::~SpeechQueue() {
    shutdown();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

uint64_t SpeechQueue::enqueue(SpeakableUnit unit) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_unit_id_++;
        unit.unit_id = id;

        if (!current_) {
            current_ = unit;
            channel_.push_back({RenderCommand::Kind::Speak, unit, epoch_});
        } else {
            pending_.push_back(std::move(unit));
        }
    }
    channel_cv_.notify_one();
    LOG_SPEECH("enqueued unit " + std::to_string(id));
    return id;
}

bool SpeechQueue::advance_locked() {
    if (!pending_.empty()) {
        current_ = std::move(pending_.front());
        pending_.pop_front();
        channel_.push_back({RenderCommand::Kind::Speak, *current_, epoch_});
        return false;
    }
    current_.reset();
    return true;
}

void SpeechQueue::reject_signal_locked(const std::string& why) {
    last_signal_error_ = Error(ErrorType::RendererSignalError, why);
    LOG_SPEECH(std::string(error_type_name(last_signal_error_.type)) + ": " + why + " ignored");
}

bool SpeechQueue::on_playback_complete() {
    bool became_idle = false;
    IdleCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_) {
            reject_signal_locked("completion while idle");
            return false;
        }
        if (current_->unit_id != delivered_unit_id_) {
            reject_signal_locked("completion before unit " + std::to_string(current_->unit_id) +
                                 " reached the sink");
            return false;
        }
        became_idle = advance_locked();
        callback = idle_callback_;
    }
    channel_cv_.notify_one();
    if (became_idle) {
        idle_cv_.notify_all();
        if (callback) callback();
    }
    return true;
}

bool SpeechQueue::on_playback_complete(uint64_t unit_id) {
    bool became_idle = false;
    IdleCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_ || current_->unit_id != unit_id) {
            reject_signal_locked("stale completion for unit " + std::to_string(unit_id));
            return false;
        }
        became_idle = advance_locked();
        callback = idle_callback_;
    }
    channel_cv_.notify_one();
    if (became_idle) {
        idle_cv_.notify_all();
        if (callback) callback();
    }
    return true;
}

void SpeechQueue::cancel_all() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = pending_.size() + (current_ ? 1 : 0);
        pending_.clear();
        current_.reset();
        channel_.clear();
        ++epoch_;
        channel_.push_back({RenderCommand::Kind::Stop, SpeakableUnit{}, epoch_});
    }
    channel_cv_.notify_one();
    idle_cv_.notify_all();
    if (dropped > 0) {
        LOG_SPEECH("cancelled " + std::to_string(dropped) + " unit(s)");
    }
}

Error SpeechQueue::last_signal_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_signal_error_;
}

std::optional<SpeakableUnit> SpeechQueue::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

size_t SpeechQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool SpeechQueue::is_idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !current_ && pending_.empty();
}

bool SpeechQueue::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [this] { return !current_ && pending_.empty(); };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void SpeechQueue::set_idle_callback(IdleCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_callback_ = std::move(callback);
}

void SpeechQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    channel_cv_.notify_all();
    idle_cv_.notify_all();
}

void SpeechQueue::dispatcher_thread() {
    while (true) {
        RenderCommand cmd;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            channel_cv_.wait(lock, [this] {
                return !channel_.empty() || !running_;
            });

            if (!running_) {
                break;
            }

            cmd = std::move(channel_.front());
            channel_.pop_front();

            // Superseded by a cancel_all since it was posted
            if (cmd.epoch != epoch_) {
                continue;
            }
            if (cmd.kind == RenderCommand::Kind::Speak) {
                delivered_unit_id_ = cmd.unit.unit_id;
            }
        }

        if (!sink_) {
            continue;
        }

        if (cmd.kind == RenderCommand::Kind::Stop) {
            try {
                sink_->stop();
            } catch (const std::exception& e) {
                Logger::warn(std::string("Playback sink stop failed: ") + e.what());
            }
            continue;
        }

        ++dispatched_count_;
        LOG_SPEECH("speak unit " + std::to_string(cmd.unit.unit_id) + " (turn " +
                   std::to_string(cmd.unit.turn_id) + ", waited " + std::to_string(ms_since(cmd.unit.emitted_at)) +
                   " ms): " + utils::preview(cmd.unit.text, 50));
        try {
            sink_->speak(cmd.unit);
        } catch (const std::exception& e) {
            // A unit the sink refused will never be completed by it
            Logger::error(std::string("Playback sink failed: ") + e.what());
            on_playback_complete(cmd.unit.unit_id);
        }
    }
}

} // namespace avatar_tutor
