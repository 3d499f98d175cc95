/**
 * Console renderer tests.
 * Asserts:
 * - Speaking time follows word count with a floor.
 * - Captions are printed and completion reported through the speech queue.
 * - stop() cuts the current unit short and still reports it.
 *
 * Run from build dir: ./test_console_renderer
 */

#include "console_renderer.h"
#include "speech_queue.h"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace avatar_tutor;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static SpeakableUnit unit(const std::string& text) {
    SpeakableUnit u;
    u.text = text;
    u.turn_id = 1;
    u.emitted_at = Clock::now();
    return u;
}

int main() {
    // --- Duration estimate ---
    ASSERT(ConsoleRenderer::estimate_duration_ms("", 160, 300) == 300);
    ASSERT(ConsoleRenderer::estimate_duration_ms("one two", 120, 100) == 1000);
    ASSERT(ConsoleRenderer::estimate_duration_ms("  spaced   out words ", 60, 0) == 3000);
    ASSERT(ConsoleRenderer::estimate_duration_ms("word", 0, 250) == 250);

    // --- Queue drained through the renderer ---
    {
        config::SpeechConfig speech;
        speech.avatar_character = "lisa";
        speech.words_per_minute = 60000;  // 1 ms per word
        speech.min_unit_ms = 1;

        std::ostringstream captions;
        ConsoleRenderer renderer(speech, captions);
        SpeechQueue queue(&renderer);
        renderer.set_completion_handler([&queue](uint64_t id) { queue.on_playback_complete(id); });

        queue.enqueue(unit("Hello there."));
        queue.enqueue(unit(" How are you?"));
        ASSERT(queue.wait_idle(2000));
        ASSERT(renderer.completed_count() == 2);
        ASSERT(captions.str() == "[lisa] Hello there.\n[lisa]  How are you?\n");

        renderer.set_completion_handler(nullptr);
    }

    // --- stop() interrupts a long unit ---
    {
        config::SpeechConfig speech;
        speech.words_per_minute = 1;  // one minute per word
        speech.min_unit_ms = 1;

        std::ostringstream captions;
        ConsoleRenderer renderer(speech, captions);
        SpeechQueue queue(&renderer);
        renderer.set_completion_handler([&queue](uint64_t id) { queue.on_playback_complete(id); });

        auto started = std::chrono::steady_clock::now();
        queue.enqueue(unit("very long sentence"));
        queue.enqueue(unit("never heard"));
        for (int i = 0; i < 200 && queue.dispatched_count() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT(queue.dispatched_count() == 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        queue.cancel_all();
        ASSERT(queue.is_idle());

        // The interrupted unit is still reported; the queue ignores it
        for (int i = 0; i < 400 && renderer.completed_count() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT(renderer.completed_count() == 1);
        auto elapsed = std::chrono::steady_clock::now() - started;
        ASSERT(elapsed < std::chrono::seconds(5));
        ASSERT(queue.is_idle());
        ASSERT(captions.str().find("never heard") == std::string::npos);

        renderer.set_completion_handler(nullptr);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All console renderer tests passed.\n";
    return 0;
}
