#pragma once

/**
 * @file console_renderer.h
 * @brief Reference playback sink that prints captions to the terminal
 *
 * Stands in for the talking-avatar renderer: each unit is printed as a
 * caption and "spoken" for a duration estimated from its word count, on the
 * renderer's own thread. Completion is reported through the handler set by
 * set_completion_handler().
 */

#include "core/config.h"
#include "playback_sink.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace avatar_tutor {

class ConsoleRenderer : public IPlaybackSink {
public:
    using CompletionHandler = std::function<void(uint64_t unit_id)>;

    /**
     * @param config Voice, character and pacing
     * @param out Caption stream; must outlive the renderer
     */
    explicit ConsoleRenderer(const config::SpeechConfig& config, std::ostream& out);
    ~ConsoleRenderer() override;

    // Non-copyable
    ConsoleRenderer(const ConsoleRenderer&) = delete;
    ConsoleRenderer& operator=(const ConsoleRenderer&) = delete;

    /// Must be set before the first speak()
    void set_completion_handler(CompletionHandler handler);

    void speak(const SpeakableUnit& unit) override;

    /// Cuts the unit being spoken short and drops units not yet started
    void stop() override;

    /// Units whose playback has been reported complete
    uint64_t completed_count() const;

    /**
     * @brief Simulated speaking time for a piece of text
     * @return max(min_unit_ms, words * 60000 / words_per_minute)
     */
    static int estimate_duration_ms(const std::string& text, int words_per_minute, int min_unit_ms);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace avatar_tutor
