#include "config.hpp"
#include "provider.hpp"
#include "http.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "stream_orchestrator.hpp"
#include "session_view_cache.hpp"
#include "store/sqlite_chat_store.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <memory>
#include <mutex>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: multichat [options]\n"
              << "\n"
              << "Options:\n"
              << "  --provider NAME      Use specific provider (openai, openrouter, ollama, compatible)\n"
              << "  --model NAME         Use specific model\n"
              << "  --db PATH            Chat database path (default: ~/.multichat/chats.db)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  OPENROUTER_API_KEY   API key for OpenRouter\n"
              << "  COMPATIBLE_API_KEY   API key for an OpenAI-compatible endpoint\n"
              << "  COMPATIBLE_BASE_URL  Base URL for an OpenAI-compatible endpoint\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434/v1)\n"
              << "  MULTICHAT_DB_PATH    Chat database path\n";
}

static void print_help() {
    std::cout << "Commands:\n"
              << "  /new [id]       Start a new chat\n"
              << "  /switch ID      Switch to an existing chat\n"
              << "  /sessions       List chats (* active, ~ streaming)\n"
              << "  /stop           Stop the current response\n"
              << "  /close ID       Stop and delete a chat\n"
              << "  /history        Show the loaded transcript\n"
              << "  /more           Load older messages\n"
              << "  /search TEXT    Search this chat (no text clears)\n"
              << "  /stats          Show view cache and stream counts\n"
              << "  /help           Show this help\n"
              << "  /quit, /exit    Exit\n";
}

// Prints the active view's reply as it grows. Only entries added after
// the watch/expect point are printed.
class ReplyPrinter {
public:
    void watch(const std::shared_ptr<multichat::SessionView>& view) {
        auto snap = view->snapshot();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (view_ && view_ != view) view_->set_on_change(nullptr);
            view_ = view;
            baseline_ = snap.messages.size();
            printed_ = 0;
            // A reply already streaming was shown with the history
            if (!snap.messages.empty() && snap.is_loading &&
                snap.messages.back().role == multichat::Role::Assistant &&
                !snap.messages.back().finalized()) {
                baseline_--;
                printed_ = snap.messages.back().content.size();
            }
        }
        std::weak_ptr<multichat::SessionView> weak = view;
        view->set_on_change([this, weak]() {
            if (auto v = weak.lock()) on_change(*v);
        });
    }

    void expect_reply(size_t baseline) {
        std::lock_guard<std::mutex> lock(mutex_);
        baseline_ = baseline;
        printed_ = 0;
    }

private:
    void on_change(const multichat::SessionView& view) {
        auto snap = view.snapshot();
        std::lock_guard<std::mutex> lock(mutex_);
        if (snap.messages.size() <= baseline_) return;

        const auto& last = snap.messages.back();
        if (last.role != multichat::Role::Assistant) return;
        if (last.content.size() > printed_) {
            std::cout << last.content.substr(printed_) << std::flush;
            printed_ = last.content.size();
        }
        if (!snap.is_loading) {
            std::cout << "\n\n" << std::flush;
            baseline_ = snap.messages.size();
            printed_ = 0;
        }
    }

    std::mutex mutex_;
    std::shared_ptr<multichat::SessionView> view_;
    size_t baseline_ = 0;
    size_t printed_ = 0;
};

static void print_history(const multichat::SessionViewSnapshot& snap) {
    if (snap.has_more) std::cout << "(older messages available, /more)\n";
    for (const auto& msg : snap.messages) {
        if (msg.outdated) continue;
        std::cout << (msg.role == multichat::Role::User ? "you> " : "ai> ")
                  << msg.content << (msg.failed ? "  [failed]" : "") << "\n";
    }
}

int main(int argc, char* argv[]) try {
    std::string provider_name;
    std::string model_name;
    std::string db_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    multichat::http_init();
    auto config = multichat::Config::load();

    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;
    if (!db_path.empty()) config.store.path = db_path;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    multichat::http_set_abort_flag(&g_shutdown);

    multichat::CurlHttpClient http_client;
    std::unique_ptr<multichat::Provider> provider;
    try {
        provider = multichat::create_provider(config.provider, config, http_client);
    } catch (const std::exception& e) {
        std::cerr << "Error creating provider: " << e.what() << "\n";
        multichat::http_cleanup();
        return 1;
    }

    std::unique_ptr<multichat::SqliteChatStore> store;
    try {
        store = std::make_unique<multichat::SqliteChatStore>(config.store_path());
    } catch (const std::exception& e) {
        std::cerr << "Error opening chat database: " << e.what() << "\n";
        multichat::http_cleanup();
        return 1;
    }

    multichat::EventBus bus;
    ReplyPrinter printer;
    multichat::StreamOrchestrator orchestrator(*provider, *store, bus, config);
    multichat::SessionViewCache cache(orchestrator, *store, bus, config.view_cache);

    // Replies finishing in background chats
    auto on_done = multichat::subscribe_scoped<multichat::StreamCompletedEvent>(bus,
        [&cache](const multichat::StreamCompletedEvent& ev) {
            auto active = cache.active_session();
            if (active && *active == ev.session_id) return;
            std::cerr << "[" << ev.session_id << "] Reply ready (" << ev.duration_ms << "ms)\n";
        });

    // Resume the most recent chat or start a fresh one
    auto recent = store->list_sessions(1);
    std::shared_ptr<multichat::SessionView> view;
    if (!recent.empty()) {
        view = cache.switch_to_session(recent.front().id);
        print_history(view->snapshot());
        printer.watch(view);
    } else {
        view = cache.create_new_session(multichat::generate_id());
        printer.watch(view);
    }

    std::cout << "multichat\n"
              << "Provider: " << provider->provider_name()
              << " | Model: " << config.model << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << view->session_id().substr(0, 8) << "> " << std::flush;

        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        line = multichat::trim(line);
        if (line.empty()) continue;

        if (line[0] != '/') {
            printer.expect_reply(view->snapshot().messages.size());
            if (!view->send_message(line)) {
                auto snap = view->snapshot();
                if (snap.error_message) {
                    std::cout << *snap.error_message << "\n";
                } else if (snap.is_loading) {
                    std::cout << "Still responding. Use /stop to cancel.\n";
                }
            }
            continue;
        }

        auto parts = multichat::split(line, ' ');
        const std::string& cmd = parts[0];
        std::string arg = line.size() > cmd.size() ? multichat::trim(line.substr(cmd.size())) : "";

        if (cmd == "/quit" || cmd == "/exit") {
            break;
        } else if (cmd == "/help") {
            print_help();
        } else if (cmd == "/new") {
            std::string id = arg.empty() ? multichat::generate_id() : arg;
            view = cache.create_new_session(id);
            printer.watch(view);
            std::cout << "New chat: " << id << "\n";
        } else if (cmd == "/switch") {
            if (arg.empty() || !store->session_exists(arg)) {
                std::cout << "Unknown chat: " << arg << "\n";
                continue;
            }
            view = cache.switch_to_session(arg);
            print_history(view->snapshot());
            printer.watch(view);
        } else if (cmd == "/sessions") {
            auto active = cache.active_session();
            for (const auto& info : store->list_sessions(50)) {
                bool is_active = active && *active == info.id;
                bool streaming = orchestrator.has_active_stream(info.id);
                std::cout << (is_active ? "* " : "  ") << (streaming ? "~ " : "  ")
                          << info.id << "  " << info.title
                          << " (" << info.message_count << " messages)\n";
            }
        } else if (cmd == "/stop") {
            view->cancel_response();
            std::cout << "\nStopped.\n";
        } else if (cmd == "/close") {
            if (arg.empty()) {
                std::cout << "Usage: /close ID\n";
                continue;
            }
            bool was_current = view->session_id() == arg;
            cache.close_session(arg);
            store->delete_session(arg);
            std::cout << "Closed " << arg << "\n";
            if (was_current) {
                view = cache.create_new_session(multichat::generate_id());
                printer.watch(view);
            }
        } else if (cmd == "/history") {
            print_history(view->snapshot());
        } else if (cmd == "/more") {
            if (view->load_previous_messages()) {
                print_history(view->snapshot());
            } else {
                std::cout << "No older messages.\n";
            }
        } else if (cmd == "/search") {
            if (arg.empty()) {
                view->clear_search();
                continue;
            }
            view->search_messages(arg);
            auto snap = view->snapshot();
            std::cout << snap.search_results.size() << " result(s)\n";
            for (const auto& msg : snap.search_results) {
                std::cout << "  " << multichat::role_to_string(msg.role) << ": "
                          << msg.content.substr(0, 80) << "\n";
            }
        } else if (cmd == "/stats") {
            auto stats = cache.stats();
            std::cout << "Cached views: " << stats.total_cached << "/" << stats.max_capacity
                      << " (active " << stats.active_count
                      << ", inactive " << stats.inactive_count << ")\n"
                      << "Running streams: " << orchestrator.active_count() << "/"
                      << orchestrator.max_concurrent_streams() << "\n";
        } else {
            std::cout << "Unknown command: " << line << "\n";
        }
    }

    cache.shutdown();
    multichat::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
