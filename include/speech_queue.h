#pragma once

#include "core/types.h"
#include "errors.h"
#include "playback_sink.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace avatar_tutor {

/**
 * @brief Ordered single-consumer queue of speakable units
 *
 * At most one unit is current (handed to the renderer) at any instant;
 * later units wait in pending and are rendered strictly in enqueue order.
 * The queue never drops or deduplicates units.
 *
 * Every mutation of current/pending happens under one mutex, shared by the
 * producer path (enqueue) and the renderer path (on_playback_complete).
 * Render requests are posted to an internal channel in the same critical
 * section and delivered to the sink by a dedicated dispatcher thread, so the
 * sink is called in order and never while the queue lock is held.
 */
class SpeechQueue {
public:
    /**
     * @param sink Renderer; must outlive the queue
     */
    explicit SpeechQueue(IPlaybackSink* sink);

    /**
     * @brief Destructor - stops the dispatcher thread
     */
    ~SpeechQueue();

    // Non-copyable
    SpeechQueue(const SpeechQueue&) = delete;
    SpeechQueue& operator=(const SpeechQueue&) = delete;

    /**
     * @brief Add a unit; it becomes current at once if the queue is idle
     * @return unit_id assigned to the unit
     */
    uint64_t enqueue(SpeakableUnit unit);

    /**
     * @brief Renderer finished the current unit
     *
     * Advances to the next pending unit or goes idle. A call while idle, or
     * before the current unit has been handed to the sink, is ignored, so a
     * repeated report cannot skip a unit the renderer never saw. It cannot
     * tell a repeat from a genuine report once the next unit is delivered:
     * renderers that may report a completion more than once must use the
     * unit_id overload.
     *
     * @return True if the queue advanced
     */
    bool on_playback_complete();

    /**
     * @brief Renderer finished the unit with this id
     * @return True if it was current and the queue advanced; false for a
     *         stale or duplicate completion, which is ignored
     */
    bool on_playback_complete(uint64_t unit_id);

    /**
     * @brief Drop pending units and the current one
     *
     * Undelivered render requests are discarded and the sink is asked to
     * stop. Whether the renderer actually stops an in-flight unit is up to
     * the renderer.
     */
    void cancel_all();

    /// RendererSignalError for the most recent ignored completion (None if none)
    Error last_signal_error() const;

    /// Snapshot of the unit being rendered
    std::optional<SpeakableUnit> current() const;

    size_t pending_count() const;

    bool is_idle() const;

    /**
     * @brief Block until idle
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if idle, false on timeout
     */
    bool wait_idle(int timeout_ms = 0);

    /**
     * @brief Observer fired (outside the lock) when a completion empties the queue
     */
    void set_idle_callback(IdleCallback callback);

    /// Total units handed to the sink
    uint64_t dispatched_count() const { return dispatched_count_; }

    /**
     * @brief Stop the dispatcher; undelivered requests are dropped
     */
    void shutdown();

private:
    struct RenderCommand {
        enum class Kind { Speak, Stop };
        Kind kind = Kind::Speak;
        SpeakableUnit unit;
        uint64_t epoch = 0;
    };

    void dispatcher_thread();
    /// Requires mutex_ held; returns true if the queue became idle
    bool advance_locked();
    /// Requires mutex_ held; records and logs an ignored completion
    void reject_signal_locked(const std::string& why);

    IPlaybackSink* sink_;

    mutable std::mutex mutex_;
    std::condition_variable channel_cv_;
    std::condition_variable idle_cv_;

    std::optional<SpeakableUnit> current_;
    std::deque<SpeakableUnit> pending_;
    std::deque<RenderCommand> channel_;
    uint64_t next_unit_id_ = 1;
    uint64_t epoch_ = 0;  ///< Bumped by cancel_all
    uint64_t delivered_unit_id_ = 0;  ///< Last unit handed to the sink
    Error last_signal_error_;
    IdleCallback idle_callback_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> dispatched_count_;
    std::thread dispatcher_;
};

} // namespace avatar_tutor
