#pragma once

/**
 * @file playback_sink.h
 * @brief Renderer side of the speech queue
 *
 * The avatar renderer (or any synthesizer) implements this interface. For
 * every unit it is handed it must eventually report completion through
 * SpeechQueue::on_playback_complete(); duplicate reports are tolerated.
 */

#include "core/types.h"

namespace avatar_tutor {

class IPlaybackSink {
public:
    virtual ~IPlaybackSink() = default;

    /**
     * @brief Begin rendering one unit
     *
     * Called from the speech queue's dispatcher thread, never under the queue
     * lock, strictly in enqueue order. Should hand the work off and return.
     */
    virtual void speak(const SpeakableUnit& unit) = 0;

    /**
     * @brief Best-effort request to stop the unit currently being rendered
     *
     * Advisory only; a renderer that cannot interrupt may ignore it.
     */
    virtual void stop() = 0;
};

} // namespace avatar_tutor
