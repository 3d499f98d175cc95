#include "console_renderer.h"
#include "conversation_session.h"
#include "core/config.h"
#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <signal.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace avatar_tutor {

static std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int /*signal*/) {
    g_shutdown_requested = true;
}

namespace {

void install_signal_handlers() {
    // No SA_RESTART: a blocked read on stdin returns so the loop can exit
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void print_help() {
    std::cout << "Type a question and press Enter. Commands:\n"
              << "  /voice <text>  submit text as recognized speech\n"
              << "  /start         start the session\n"
              << "  /stop          stop the session\n"
              << "  /clear         clear the conversation history\n"
              << "  /history       print the transcript as JSON\n"
              << "  /status        show session and speech state\n"
              << "  /quit          exit\n";
}

void report_submit(const SubmitResult& result) {
    if (result.accepted) {
        std::cout << "(turn " << result.turn_id << ")" << std::endl;
    } else {
        std::cout << "(ignored: " << reject_reason_name(result.reason) << ")" << std::endl;
    }
}

void print_status(ConversationSession& session) {
    auto turn = session.current_turn();
    auto& queue = session.speech_queue();
    std::cout << "session: " << (session.is_active() ? "active" : "inactive") << "\n"
              << "turn: ";
    if (turn) {
        std::cout << turn->turn_id << " " << turn_status_name(turn->status)
                  << " (" << channel_name(turn->input_channel) << ")";
    } else {
        std::cout << "none";
    }
    std::cout << "\nspeech: " << (queue.is_idle() ? "idle" : "speaking")
              << ", pending " << queue.pending_count()
              << ", delivered " << queue.dispatched_count() << std::endl;
}

/// Owns the session and its collaborators; all worker threads end before it returns
int run(const Config& config) {
    const config::RetrievalConfig* retrieval = nullptr;
    if (config.retrieval.enabled) {
        if (config.retrieval.is_usable()) {
            retrieval = &config.retrieval;
        } else {
            Logger::warn("Retrieval enabled but incomplete; continuing without data source");
        }
    }

    AzureChatClient client(config.llm);
    ConsoleRenderer renderer(config.speech, std::cout);
    ConversationSession session(config.session, &client, &renderer, retrieval);
    renderer.set_completion_handler([&session](uint64_t unit_id) {
        session.speech_queue().on_playback_complete(unit_id);
    });

    install_signal_handlers();

    session.start(retrieval != nullptr);
    print_help();

    std::string line;
    while (!g_shutdown_requested) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        utils::trim(line);

        if (line == "/quit") {
            break;
        } else if (line == "/start") {
            session.start(retrieval != nullptr);
        } else if (line == "/stop") {
            session.stop();
        } else if (line == "/clear") {
            auto result = session.clear_history();
            if (!result.ok()) {
                std::cout << "(" << result.error << ")" << std::endl;
            }
        } else if (line == "/history") {
            std::cout << session.history_json() << std::endl;
        } else if (line == "/status") {
            print_status(session);
        } else if (line == "/help") {
            print_help();
        } else if (line.compare(0, 6, "/voice") == 0 && (line.size() == 6 || line[6] == ' ')) {
            report_submit(session.submit(InputChannel::Voice, line.substr(6)));
        } else if (!line.empty() && line[0] == '/') {
            std::cout << "(unknown command " << line << ")" << std::endl;
        } else {
            report_submit(session.submit(InputChannel::Typed, line));
        }
    }

    if (!g_shutdown_requested && !std::cin) {
        // End of piped input: let the last answer finish
        if (!session.wait_for_turn(config.llm.timeout_ms * 2)) {
            Logger::warn("Gave up waiting for the last turn");
        }
    }

    Logger::info("Shutting down...");
    session.stop();
    renderer.set_completion_handler(nullptr);
    return 0;
}

} // anonymous namespace

} // namespace avatar_tutor

int main(int argc, char* argv[]) {
    using namespace avatar_tutor;

    // Console logging until the config says otherwise
    Logger::initialize(LogLevel::INFO);

    Config config = Config::defaults();
    if (argc > 1) {
        auto loaded = Config::load(argv[1]);
        if (!loaded.ok()) {
            Logger::error(loaded.error);
            Logger::shutdown();
            return 1;
        }
        config = *loaded.value;
    }
    config.apply_env_overrides();

    Logger::shutdown();
    Logger::initialize(Logger::parse_level(config.logging.level), config.logging.file);

    std::string problems = config.validate();
    if (!problems.empty()) {
        Logger::error("Invalid configuration: " + problems);
        Logger::shutdown();
        return 1;
    }

    int result = run(config);

    Logger::shutdown();
    return result;
}
