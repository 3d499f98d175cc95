#pragma once

/**
 * Scripted collaborators for session and queue tests.
 * No network or renderer required.
 */

#include "model_client.h"
#include "playback_sink.h"
#include "speech_queue.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace avatar_tutor {
namespace testing {

/**
 * Model client that replays a fixed list of fragments, then returns `result`.
 * With hold() set, the stream blocks before its first fragment until release().
 */
class FakeModelClient : public IModelClient {
public:
    std::vector<std::string> fragments;
    Error result;
    std::string throw_message;  ///< Non-empty: throw after the fragments

    Error stream_reply(const std::vector<Message>& history,
                       const config::RetrievalConfig* retrieval,
                       const FragmentCallback& on_fragment,
                       const AbortCheck& should_abort) override {
        int call = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            call = calls_;
            histories_.push_back(history);
            saw_retrieval_ = retrieval != nullptr;
        }
        cv_.notify_all();

        // A held stream behaves like a backend that never answers: only
        // release() or the caller's abandonment check ends the wait.
        bool aborted = false;
        while (!aborted) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, std::chrono::milliseconds(5), [&] { return !is_held(call); })) {
                    break;
                }
            }
            aborted = should_abort && should_abort();
        }

        Error err = aborted ? make_cancelled_error("aborted while waiting on the backend")
                            : replay(on_fragment, should_abort);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++finished_;
        }
        cv_.notify_all();
        if (!throw_message.empty() && !err) {
            throw std::runtime_error(throw_message);
        }
        return err;
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
        hold_limit_ = 0;
    }

    /// Hold only the first `count` streams; later ones run straight through
    void hold_first(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
        hold_limit_ = count;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    /// Wait until stream_reply has been entered `count` times
    bool wait_for_calls(int count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return calls_ >= count; });
    }

    /// Wait until stream_reply has returned `count` times
    bool wait_for_finished(int count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return finished_ >= count; });
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<Message> last_history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return histories_.empty() ? std::vector<Message>{} : histories_.back();
    }

    bool saw_retrieval() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saw_retrieval_;
    }

private:
    bool is_held(int call) const {
        return held_ && (hold_limit_ == 0 || call <= hold_limit_);
    }

    Error replay(const FragmentCallback& on_fragment, const AbortCheck& should_abort) {
        for (const auto& fragment : fragments) {
            if (should_abort && should_abort()) {
                return make_cancelled_error();
            }
            if (!on_fragment(fragment)) {
                return make_cancelled_error();
            }
        }
        return result;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    int hold_limit_ = 0;  ///< 0 holds every stream
    int calls_ = 0;
    int finished_ = 0;
    bool saw_retrieval_ = false;
    std::vector<std::vector<Message>> histories_;
};

/**
 * Sink that records every unit it is handed. With auto_complete it reports
 * completion to the queue from inside speak(); otherwise the test drives
 * completion through complete_next().
 */
class RecordingSink : public IPlaybackSink {
public:
    explicit RecordingSink(bool auto_complete = false) : auto_complete_(auto_complete) {}

    void attach(SpeechQueue* queue) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_ = queue;
    }

    void speak(const SpeakableUnit& unit) override {
        SpeechQueue* queue = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            units_.push_back(unit);
            queue = auto_complete_ ? queue_ : nullptr;
        }
        cv_.notify_all();
        if (queue) {
            queue->on_playback_complete(unit.unit_id);
        }
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stops_;
        }
        cv_.notify_all();
    }

    /// Report completion of the most recently spoken unit
    bool complete_last() {
        SpeechQueue* queue = nullptr;
        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!queue_ || units_.empty()) return false;
            queue = queue_;
            id = units_.back().unit_id;
        }
        return queue->on_playback_complete(id);
    }

    bool wait_for_units(size_t count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return units_.size() >= count; });
    }

    bool wait_for_stops(int count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return stops_ >= count; });
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& u : units_) out.push_back(u.text);
        return out;
    }

    std::vector<SpeakableUnit> units() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return units_;
    }

    int stops() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stops_;
    }

private:
    bool auto_complete_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SpeechQueue* queue_ = nullptr;
    std::vector<SpeakableUnit> units_;
    int stops_ = 0;
};

/// Poll until pred() holds or timeout_ms elapses
template <typename Pred>
bool eventually(Pred pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace testing
} // namespace avatar_tutor
