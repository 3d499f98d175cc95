#include "console_renderer.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>

namespace avatar_tutor {

class ConsoleRenderer::Impl {
public:
    Impl(const config::SpeechConfig& config, std::ostream& out)
        : config_(config), out_(out), running_(true), completed_(0) {
        worker_ = std::thread(&Impl::worker_thread, this);
        LOG_RENDER("console renderer ready (voice=" + config_.tts_voice +
                   ", character=" + config_.avatar_character + "/" + config_.avatar_style + ")");
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            interrupted_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void set_completion_handler(CompletionHandler handler) {
        // Waits out a completion being reported right now
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void speak(const SpeakableUnit& unit) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(unit);
        }
        cv_.notify_all();
    }

    void stop() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = pending_.size();
            pending_.clear();
            interrupted_ = true;
        }
        cv_.notify_all();
        LOG_RENDER("stop requested (" + std::to_string(dropped) + " unstarted unit(s) dropped)");
    }

    uint64_t completed_count() const {
        return completed_;
    }

private:
    void worker_thread() {
        while (true) {
            SpeakableUnit unit;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !pending_.empty() || !running_; });
                if (!running_) {
                    break;
                }
                unit = std::move(pending_.front());
                pending_.pop_front();
                interrupted_ = false;
            }

            const int duration_ms = estimate_duration_ms(unit.text, config_.words_per_minute,
                                                         config_.min_unit_ms);
            out_ << "[" << config_.avatar_character << "] " << unit.text << std::endl;
            LOG_RENDER("unit " + std::to_string(unit.unit_id) + " speaking for " +
                       std::to_string(duration_ms) + " ms");

            bool cut_short = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cut_short = cv_.wait_for(lock, std::chrono::milliseconds(duration_ms),
                                         [this] { return interrupted_ || !running_; });
                if (!running_) {
                    break;
                }
            }

            if (cut_short) {
                LOG_RENDER("unit " + std::to_string(unit.unit_id) + " interrupted");
            }
            ++completed_;
            std::lock_guard<std::mutex> lock(handler_mutex_);
            if (handler_) {
                handler_(unit.unit_id);
            }
        }
    }

    config::SpeechConfig config_;
    std::ostream& out_;

    std::mutex mutex_;
    std::mutex handler_mutex_;
    std::condition_variable cv_;
    std::deque<SpeakableUnit> pending_;
    CompletionHandler handler_;
    bool running_;
    bool interrupted_ = false;
    std::atomic<uint64_t> completed_;
    std::thread worker_;
};

ConsoleRenderer::ConsoleRenderer(const config::SpeechConfig& config, std::ostream& out)
    : pimpl_(std::make_unique<Impl>(config, out)) {}

ConsoleRenderer::~ConsoleRenderer() = default;

void ConsoleRenderer::set_completion_handler(CompletionHandler handler) {
    pimpl_->set_completion_handler(std::move(handler));
}

void ConsoleRenderer::speak(const SpeakableUnit& unit) {
    pimpl_->speak(unit);
}

void ConsoleRenderer::stop() {
    pimpl_->stop();
}

uint64_t ConsoleRenderer::completed_count() const {
    return pimpl_->completed_count();
}

int ConsoleRenderer::estimate_duration_ms(const std::string& text, int words_per_minute, int min_unit_ms) {
    std::istringstream iss(text);
    std::string word;
    long words = 0;
    while (iss >> word) {
        ++words;
    }
    long duration = 0;
    if (words_per_minute > 0) {
        duration = words * 60000L / words_per_minute;
    }
    return static_cast<int>(std::max<long>(duration, min_unit_ms));
}

} // namespace avatar_tutor
