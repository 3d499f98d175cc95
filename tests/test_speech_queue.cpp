/**
 * Speech queue tests.
 * Asserts:
 * - Units reach the sink one at a time, in enqueue order.
 * - Duplicate or stale completions are ignored and reported as signal errors.
 * - A repeated id-less completion cannot skip a unit the sink never received.
 * - cancel_all() empties the queue and asks the sink to stop.
 *
 * Run from build dir: ./test_speech_queue
 */

#include "speech_queue.h"
#include "test_fakes.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace avatar_tutor;
using namespace avatar_tutor::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

/// Sink whose first speak() blocks until open(), holding up the dispatcher
class GatedSink : public IPlaybackSink {
public:
    void speak(const SpeakableUnit& unit) override {
        std::unique_lock<std::mutex> lock(mutex_);
        texts_.push_back(unit.text);
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    void stop() override {}

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool wait_for_units(size_t count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return texts_.size() >= count; });
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> texts_;
    bool open_ = false;
};

static SpeakableUnit unit(const std::string& text, uint64_t turn_id = 1) {
    SpeakableUnit u;
    u.text = text;
    u.turn_id = turn_id;
    u.emitted_at = Clock::now();
    return u;
}

int main() {
    // --- Strict ordering, one unit at a time ---
    {
        RecordingSink sink;
        SpeechQueue queue(&sink);
        sink.attach(&queue);

        ASSERT(queue.is_idle());
        uint64_t a = queue.enqueue(unit("A"));
        uint64_t b = queue.enqueue(unit("B"));
        uint64_t c = queue.enqueue(unit("C"));
        ASSERT(a < b && b < c);

        ASSERT(sink.wait_for_units(1));
        ASSERT(queue.current().has_value() && queue.current()->text == "A");
        ASSERT(queue.pending_count() == 2);
        ASSERT(sink.texts().size() == 1);

        ASSERT(sink.complete_last());
        ASSERT(sink.wait_for_units(2));
        ASSERT(queue.current().has_value() && queue.current()->text == "B");

        ASSERT(sink.complete_last());
        ASSERT(sink.wait_for_units(3));
        ASSERT(sink.complete_last());
        ASSERT(queue.is_idle());
        ASSERT((sink.texts() == std::vector<std::string>{"A", "B", "C"}));

        // Duplicate completion while idle is a no-op
        ASSERT(queue.last_signal_error().type == ErrorType::None);
        ASSERT(!queue.on_playback_complete());
        ASSERT(queue.is_idle());
        ASSERT(queue.last_signal_error().type == ErrorType::RendererSignalError);
        ASSERT(!queue.on_playback_complete(c));
        ASSERT(sink.texts().size() == 3);
    }

    // --- Stale unit id does not advance ---
    {
        RecordingSink sink;
        SpeechQueue queue(&sink);
        sink.attach(&queue);

        uint64_t a = queue.enqueue(unit("first"));
        queue.enqueue(unit("second"));
        ASSERT(sink.wait_for_units(1));
        ASSERT(!queue.on_playback_complete(a + 5));
        ASSERT(queue.last_signal_error().type == ErrorType::RendererSignalError);
        ASSERT(queue.current().has_value() && queue.current()->unit_id == a);
        ASSERT(queue.on_playback_complete(a));
        ASSERT(!queue.on_playback_complete(a));
        ASSERT(sink.wait_for_units(2));
        ASSERT(queue.pending_count() == 0);
    }

    // --- Repeated id-less completion while the next unit is still undelivered ---
    {
        GatedSink sink;
        SpeechQueue queue(&sink);

        queue.enqueue(unit("A"));
        uint64_t b = queue.enqueue(unit("B"));
        queue.enqueue(unit("C"));
        ASSERT(sink.wait_for_units(1));

        // The dispatcher is stuck in speak(A); B becomes current but is not delivered
        ASSERT(queue.on_playback_complete());
        ASSERT(!queue.on_playback_complete());
        ASSERT(queue.last_signal_error().type == ErrorType::RendererSignalError);
        ASSERT(queue.current().has_value() && queue.current()->unit_id == b);
        ASSERT(queue.pending_count() == 1);

        sink.open();
        ASSERT(sink.wait_for_units(2));
        ASSERT(!sink.wait_for_units(3, 100));
        ASSERT((sink.texts() == std::vector<std::string>{"A", "B"}));
        ASSERT(queue.current().has_value() && queue.current()->text == "B");
        ASSERT(queue.pending_count() == 1);

        // Once B is in the sink, an id-less report advances again
        ASSERT(queue.on_playback_complete());
        ASSERT(sink.wait_for_units(3));
        ASSERT(sink.texts().back() == "C");
    }

    // --- Idle observer fires once the last unit completes ---
    {
        std::atomic<int> idle_calls(0);
        RecordingSink sink;
        SpeechQueue queue(&sink);
        sink.attach(&queue);
        queue.set_idle_callback([&idle_calls] { ++idle_calls; });

        queue.enqueue(unit("one"));
        queue.enqueue(unit("two"));
        ASSERT(sink.wait_for_units(1));
        ASSERT(sink.complete_last());
        ASSERT(idle_calls == 0);
        ASSERT(sink.wait_for_units(2));
        ASSERT(sink.complete_last());
        ASSERT(idle_calls == 1);
        ASSERT(queue.wait_idle(100));
    }

    // --- cancel_all drops everything and stops the sink ---
    {
        RecordingSink sink;
        SpeechQueue queue(&sink);
        sink.attach(&queue);

        queue.enqueue(unit("talking"));
        queue.enqueue(unit("queued 1"));
        queue.enqueue(unit("queued 2"));
        ASSERT(sink.wait_for_units(1));

        queue.cancel_all();
        ASSERT(queue.is_idle());
        ASSERT(queue.pending_count() == 0);
        ASSERT(sink.wait_for_stops(1));

        // Late completion from the renderer for the dropped unit
        ASSERT(!sink.complete_last());
        ASSERT(queue.is_idle());

        queue.enqueue(unit("fresh"));
        ASSERT(sink.wait_for_units(2));
        ASSERT(sink.texts().back() == "fresh");
    }

    // --- Producers and a completing renderer running concurrently ---
    {
        RecordingSink sink(true);
        SpeechQueue queue(&sink);
        sink.attach(&queue);

        const int per_producer = 200;
        std::thread p1([&] {
            for (int i = 0; i < per_producer; ++i) queue.enqueue(unit("a" + std::to_string(i), 1));
        });
        std::thread p2([&] {
            for (int i = 0; i < per_producer; ++i) queue.enqueue(unit("b" + std::to_string(i), 2));
        });
        p1.join();
        p2.join();

        ASSERT(sink.wait_for_units(2 * per_producer, 5000));
        ASSERT(queue.wait_idle(5000));

        // Each producer's units arrive in its own order, none lost or repeated
        auto units = sink.units();
        ASSERT(units.size() == static_cast<size_t>(2 * per_producer));
        int next_a = 0, next_b = 0;
        uint64_t last_id = 0;
        bool ids_increasing = true;
        for (const auto& u : units) {
            if (u.unit_id <= last_id) ids_increasing = false;
            last_id = u.unit_id;
            if (u.turn_id == 1) {
                ASSERT(u.text == "a" + std::to_string(next_a));
                ++next_a;
            } else {
                ASSERT(u.text == "b" + std::to_string(next_b));
                ++next_b;
            }
        }
        ASSERT(ids_increasing);
        ASSERT(next_a == per_producer && next_b == per_producer);
        ASSERT(queue.dispatched_count() == static_cast<uint64_t>(2 * per_producer));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All speech queue tests passed.\n";
    return 0;
}
