#include "config.hpp"
#include "http.hpp"
#include "request.hpp"
#include "stream/session.hpp"
#include "stream/stats.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <chrono>
#include <mutex>

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int /*sig*/) {
    g_interrupted.store(true);
}

static constexpr const char* kSlot = "cli";

static void print_usage() {
    std::cout << "Usage: kbchat [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --mode NAME          Streaming mode (agent, direct, knowledge-base)\n"
              << "  --model NAME         Use specific model\n"
              << "  --url BASE_URL       Backend base URL\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /mode NAME           Switch streaming mode\n"
              << "  /model NAME          Switch model\n"
              << "  /stats               Show stats of the last response\n"
              << "  /history             Show this conversation\n"
              << "  /clear               Clear conversation history\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Ctrl+C stops the response being streamed.\n"
              << "\n"
              << "Environment variables:\n"
              << "  KBCHAT_BASE_URL        Backend base URL (default: http://localhost:3002)\n"
              << "  KBCHAT_MODEL           Model identifier\n"
              << "  KBCHAT_MODE            Streaming mode\n"
              << "  KBCHAT_IDLE_TIMEOUT_MS Abort a stream silent for this long\n";
}

// Stream one turn to stdout. Returns the finished turn.
static kbchat::Turn run_turn(kbchat::StreamSessionController& sessions,
                             const std::string& input,
                             const kbchat::ChatOptions& options) {
    auto handle = sessions.start_turn(kSlot, input, options);

    // Deltas are printed from the reader thread as they arrive
    std::mutex out_mutex;
    size_t printed = 0;
    uint64_t printer = handle->on_update([&](const kbchat::Turn& turn) {
        std::lock_guard<std::mutex> lock(out_mutex);
        if (turn.content.size() > printed) {
            std::cout << turn.content.substr(printed) << std::flush;
            printed = turn.content.size();
        }
    });

    g_interrupted.store(false);
    std::signal(SIGINT, signal_handler);
    while (!handle->wait_for(std::chrono::milliseconds(100))) {
        if (g_interrupted.load()) {
            handle->cancel();
            break;
        }
    }
    handle->wait();
    std::signal(SIGINT, SIG_DFL);
    // The handle outlives this frame in the slot
    handle->remove_update(printer);

    kbchat::Turn turn = handle->snapshot();
    {
        std::lock_guard<std::mutex> lock(out_mutex);
        if (turn.content.size() > printed) std::cout << turn.content.substr(printed);
    }
    std::cout << "\n";
    if (turn.status == kbchat::TurnStatus::Failed) {
        std::cerr << "Error: " << turn.error << "\n";
    } else if (turn.status == kbchat::TurnStatus::Cancelled) {
        std::cout << "[stopped]\n";
    }
    if (!turn.sources.empty()) {
        std::cout << "Sources:\n";
        for (const auto& src : turn.sources) {
            std::cout << "  - " << (src.title.empty() ? src.url : src.title);
            if (!src.url.empty() && !src.title.empty()) std::cout << " <" << src.url << ">";
            std::cout << "\n";
        }
    }
    return turn;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string mode_name;
    std::string model_name;
    std::string base_url;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            base_url = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    kbchat::http_init();
    auto config = kbchat::Config::load();

    // Override config with CLI args
    if (!mode_name.empty()) {
        auto mode = kbchat::mode_from_string(mode_name);
        if (!mode) {
            std::cerr << "Unknown mode: " << mode_name << "\n";
            kbchat::http_cleanup();
            return 1;
        }
        config.chat.mode = *mode;
    }
    if (!model_name.empty()) {
        config.chat.model = model_name;
    }
    if (!base_url.empty()) {
        config.base_url = base_url;
    }

    kbchat::PlatformStreamTransport transport;
    kbchat::StreamSessionController sessions(transport, config.session_options());

    // Single message mode
    if (!message.empty()) {
        auto turn = run_turn(sessions, message, config.chat);
        kbchat::http_cleanup();
        return turn.status == kbchat::TurnStatus::Completed ? 0 : 1;
    }

    // Interactive REPL
    std::cout << "kbchat\n"
              << "Backend: " << config.base_url
              << " | Mode: " << kbchat::mode_to_string(config.chat.mode)
              << " | Model: " << config.chat.model << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    kbchat::Turn last;
    bool have_last = false;
    std::string line;
    while (true) {
        std::cout << "kbchat> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = kbchat::trim(line);
        if (line.empty()) continue;

        // Handle slash commands
        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/stats") {
                if (!have_last) {
                    std::cout << "No response yet.\n";
                } else {
                    std::cout << kbchat::format_stats(last.stats) << "\n";
                    if (last.routing_info) {
                        std::cout << "Route: " << last.routing_info->route
                                  << " (confidence " << last.routing_info->confidence << ")\n";
                    }
                }
            } else if (line == "/history") {
                auto turns = sessions.history(kSlot);
                if (turns.empty()) std::cout << "No history.\n";
                for (const auto& t : turns) {
                    std::cout << "[" << kbchat::turn_status_name(t.status) << "] you: "
                              << t.input << "\n  assistant: " << t.content << "\n";
                }
            } else if (line == "/clear") {
                sessions.clear_history(kSlot);
                have_last = false;
                std::cout << "History cleared.\n";
            } else if (line.substr(0, 6) == "/mode ") {
                auto mode = kbchat::mode_from_string(kbchat::trim(line.substr(6)));
                if (!mode) {
                    std::cout << "Unknown mode. Use agent, direct or knowledge-base.\n";
                } else {
                    config.chat.mode = *mode;
                    config.persist_selection();
                    std::cout << "Mode set to: " << kbchat::mode_to_string(*mode) << "\n";
                }
            } else if (line.substr(0, 7) == "/model ") {
                std::string new_model = kbchat::trim(line.substr(7));
                config.chat.model = new_model;
                config.persist_selection();
                std::cout << "Model set to: " << new_model << "\n";
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /mode X   Switch to mode X (agent, direct, knowledge-base)\n"
                          << "  /model X  Switch to model X\n"
                          << "  /stats    Show stats of the last response\n"
                          << "  /history  Show this conversation\n"
                          << "  /clear    Clear conversation history\n"
                          << "  /quit     Exit\n"
                          << "  /exit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        // Stream the response
        last = run_turn(sessions, line, config.chat);
        have_last = true;
        std::cout << "\n";
    }

    sessions.cancel_all();
    kbchat::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
