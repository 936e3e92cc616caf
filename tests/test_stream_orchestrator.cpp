#include <catch2/catch.hpp>
#include "stream_orchestrator.hpp"
#include "event_bus.hpp"
#include "mock_chat_store.hpp"
#include "mock_provider.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <optional>
#include <stdexcept>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace multichat;

namespace {

// Collects stream events published from worker threads.
struct EventLog {
    std::mutex mutex;
    std::vector<std::string> tags;
    std::vector<StreamCompletedEvent> completed;
    std::vector<StreamFailedEvent> failed;
    std::vector<StreamCancelledEvent> cancelled;
    std::vector<ScopedEventSubscription> subs;

    explicit EventLog(EventBus& bus) {
        subs.push_back(subscribe_scoped<StreamStartedEvent>(bus,
            [this](const StreamStartedEvent&) { record("started"); }));
        subs.push_back(subscribe_scoped<StreamChunkEvent>(bus,
            [this](const StreamChunkEvent&) { record("chunk"); }));
        subs.push_back(subscribe_scoped<StreamCompletedEvent>(bus,
            [this](const StreamCompletedEvent& ev) {
                std::lock_guard<std::mutex> lock(mutex);
                tags.push_back("completed");
                completed.push_back(ev);
            }));
        subs.push_back(subscribe_scoped<StreamFailedEvent>(bus,
            [this](const StreamFailedEvent& ev) {
                std::lock_guard<std::mutex> lock(mutex);
                tags.push_back("failed");
                failed.push_back(ev);
            }));
        subs.push_back(subscribe_scoped<StreamCancelledEvent>(bus,
            [this](const StreamCancelledEvent& ev) {
                std::lock_guard<std::mutex> lock(mutex);
                tags.push_back("cancelled");
                cancelled.push_back(ev);
            }));
    }

    void record(const char* tag) {
        std::lock_guard<std::mutex> lock(mutex);
        tags.push_back(tag);
    }
};

struct Fixture {
    ScriptedProvider provider;
    MemoryChatStore store;
    EventBus bus;
    Config config;
    std::unique_ptr<EventLog> log;
    std::unique_ptr<StreamOrchestrator> orchestrator;

    explicit Fixture(uint32_t max_streams = 20, bool persist_cancelled = false) {
        config.system_prompt = "You are terse.";
        config.streaming.max_concurrent_streams = max_streams;
        config.streaming.worker_threads = 4;
        config.streaming.persist_cancelled = persist_cancelled;
        log = std::make_unique<EventLog>(bus);
        orchestrator = std::make_unique<StreamOrchestrator>(provider, store, bus, config);
    }

    ~Fixture() {
        provider.release();
        orchestrator->shutdown();
    }

    void hold_all(std::vector<std::string> tokens = {}, size_t hold_after = 0) {
        provider.default_script.tokens = std::move(tokens);
        provider.default_script.hold = true;
        provider.default_script.hold_after = hold_after;
    }
};

} // namespace

// ── Sending ─────────────────────────────────────────────────────

TEST_CASE("StreamOrchestrator: send registers a handle immediately", "[orchestrator]") {
    Fixture f;
    f.hold_all({"hi"});

    auto result = f.orchestrator->send_message("s1", "hi");
    REQUIRE(result.ok());
    REQUIRE(result.error == SendError::None);
    REQUIRE(result.thread_id->rfind("s1_", 0) == 0);

    auto handle = f.orchestrator->get_active_thread("s1");
    REQUIRE(handle != nullptr);
    REQUIRE(handle->thread_id() == *result.thread_id);
    REQUIRE(f.orchestrator->has_active_stream("s1"));
    REQUIRE(f.orchestrator->active_count() == 1);

    // User message is stored before the reply starts
    REQUIRE(f.store.session_exists("s1"));
    auto stored = f.store.all_messages("s1");
    REQUIRE(stored.size() == 1);
    REQUIRE(stored[0].content == "hi");
    REQUIRE(stored[0].id == result.user_message_id);

    f.provider.release();
    f.orchestrator->wait_idle();
    REQUIRE(f.orchestrator->get_active_thread("s1") == nullptr);
}

TEST_CASE("StreamOrchestrator: second send on a busy session is rejected", "[orchestrator]") {
    Fixture f;
    f.hold_all({"x"});

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    auto second = f.orchestrator->send_message("s1", "again");
    REQUIRE_FALSE(second.ok());
    REQUIRE(second.error == SendError::SessionBusy);
    REQUIRE(f.store.all_messages("s1").size() == 1);
}

TEST_CASE("StreamOrchestrator: blank message is rejected", "[orchestrator]") {
    Fixture f;
    auto result = f.orchestrator->send_message("s1", "   \n");
    REQUIRE(result.error == SendError::EmptyMessage);
    REQUIRE_FALSE(f.store.session_exists("s1"));
    REQUIRE(f.orchestrator->active_count() == 0);
}

TEST_CASE("StreamOrchestrator: store failure rejects the send", "[orchestrator]") {
    Fixture f;
    f.store.fail_writes = true;

    auto result = f.orchestrator->send_message("s1", "hi");
    REQUIRE(result.error == SendError::PersistenceFailure);
    REQUIRE_FALSE(result.ok());
    REQUIRE(f.orchestrator->active_count() == 0);
    f.orchestrator->wait_idle();
    REQUIRE(f.provider.call_count() == 0);

    // Session is usable again once the store recovers
    f.store.fail_writes = false;
    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
}

TEST_CASE("StreamOrchestrator: context holds system prompt and history", "[orchestrator]") {
    Fixture f;
    f.provider.default_script.tokens = {"ok"};
    f.store.ensure_session("s1", "t");
    f.store.record_user_message("s1", "earlier question");
    f.store.save_assistant_response("s1", "earlier answer", false);
    f.store.save_assistant_response("s1", "Response failed: x", true);

    REQUIRE(f.orchestrator->send_message("s1", "now").ok());
    f.orchestrator->wait_idle();

    auto messages = f.provider.last_messages();
    REQUIRE(messages.size() == 4);
    REQUIRE(messages[0].role == Role::System);
    REQUIRE(messages[0].content == "You are terse.");
    REQUIRE(messages[1].content == "earlier question");
    REQUIRE(messages[2].content == "earlier answer");
    REQUIRE(messages[3].role == Role::User);
    REQUIRE(messages[3].content == "now");
}

// ── Completion ──────────────────────────────────────────────────

TEST_CASE("StreamOrchestrator: subscriber sees growing content and reply is stored", "[orchestrator]") {
    Fixture f;
    f.hold_all({"Hel", "lo"}, 0);

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.provider.wait_until_held(1));

    auto handle = f.orchestrator->get_active_thread("s1");
    REQUIRE(handle != nullptr);

    std::mutex m;
    std::vector<std::string> seen;
    std::vector<StreamState> finished;
    auto sub = handle->subscribe(
        [&](const std::string& content) {
            std::lock_guard<std::mutex> lock(m);
            seen.push_back(content);
        },
        [&](StreamState state) {
            std::lock_guard<std::mutex> lock(m);
            finished.push_back(state);
        });

    f.provider.release();
    f.orchestrator->wait_idle();

    REQUIRE(seen == std::vector<std::string>{"Hel", "Hello"});
    REQUIRE(finished == std::vector<StreamState>{StreamState::Completed});
    REQUIRE(f.orchestrator->get_active_thread("s1") == nullptr);

    auto replies = f.store.assistant_messages("s1");
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0].content == "Hello");
    REQUIRE_FALSE(replies[0].failed);
    REQUIRE(handle->saved_message()->id == replies[0].id);

    REQUIRE(f.log->completed.size() == 1);
    REQUIRE(f.log->completed[0].response == "Hello");
    REQUIRE(f.log->completed[0].thread_id == handle->thread_id());
}

TEST_CASE("StreamOrchestrator: events arrive in lifecycle order", "[orchestrator]") {
    Fixture f;
    f.provider.default_script.tokens = {"a", "b", "c"};

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    f.orchestrator->wait_idle();

    std::lock_guard<std::mutex> lock(f.log->mutex);
    REQUIRE(f.log->tags == std::vector<std::string>{
        "started", "chunk", "chunk", "chunk", "completed"});
}

TEST_CASE("StreamOrchestrator: chunks keep production order", "[orchestrator]") {
    Fixture f;
    std::vector<std::string> tokens;
    std::string expected;
    for (int i = 0; i < 300; i++) {
        tokens.push_back("<" + std::to_string(i) + ">");
        expected += tokens.back();
    }
    f.hold_all(tokens, 0);

    REQUIRE(f.orchestrator->send_message("s1", "go").ok());
    REQUIRE(f.provider.wait_until_held(1));
    auto handle = f.orchestrator->get_active_thread("s1");
    f.provider.release();
    f.orchestrator->wait_idle();

    REQUIRE(handle->chunks() == tokens);
    REQUIRE(f.store.assistant_messages("s1")[0].content == expected);
}

// ── Failure ─────────────────────────────────────────────────────

TEST_CASE("StreamOrchestrator: provider failure keeps partial content", "[orchestrator]") {
    Fixture f;
    f.provider.default_script.tokens = {"par", "tial"};
    f.provider.default_script.error = "connection reset";

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    f.orchestrator->wait_idle();

    REQUIRE(f.orchestrator->get_active_thread("s1") == nullptr);

    auto replies = f.store.assistant_messages("s1");
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0].failed);
    REQUIRE(replies[0].content == "partial\n\nResponse failed: connection reset");

    REQUIRE(f.log->failed.size() == 1);
    REQUIRE(f.log->failed[0].error == "connection reset");
    REQUIRE(f.log->failed[0].partial_response.value_or("") == "partial");
    REQUIRE(f.log->completed.empty());
}

TEST_CASE("StreamOrchestrator: failure before any output", "[orchestrator]") {
    Fixture f;
    f.provider.default_script.error = "401 unauthorized";

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    f.orchestrator->wait_idle();

    auto replies = f.store.assistant_messages("s1");
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0].content == "Response failed: 401 unauthorized");
    REQUIRE_FALSE(f.log->failed[0].partial_response.has_value());
}

TEST_CASE("StreamOrchestrator: failure in one session leaves others running", "[orchestrator]") {
    Fixture f;
    ScriptedProvider::Script failing;
    failing.tokens = {"x"};
    failing.error = "boom";
    f.provider.script_for("bad", failing);
    f.provider.default_script.tokens = {"fine"};

    REQUIRE(f.orchestrator->send_message("s1", "bad").ok());
    REQUIRE(f.orchestrator->send_message("s2", "good").ok());
    f.orchestrator->wait_idle();

    REQUIRE(f.store.assistant_messages("s1")[0].failed);
    REQUIRE(f.store.assistant_messages("s2")[0].content == "fine");
    REQUIRE_FALSE(f.store.assistant_messages("s2")[0].failed);
}

// ── Stopping ────────────────────────────────────────────────────

TEST_CASE("StreamOrchestrator: stop removes the handle at once", "[orchestrator]") {
    Fixture f;
    f.hold_all({"a", "b", "c"}, 1);

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.provider.wait_until_held(1));
    auto handle = f.orchestrator->get_active_thread("s1");

    REQUIRE(f.orchestrator->stop_stream("s1"));
    REQUIRE(f.orchestrator->get_active_thread("s1") == nullptr);
    REQUIRE(handle->state() == StreamState::Cancelled);
    REQUIRE(handle->cancel_token().cancelled());

    // Stopping again is a logged no-op
    REQUIRE_FALSE(f.orchestrator->stop_stream("s1"));
    REQUIRE_FALSE(f.orchestrator->stop_stream("s1"));

    f.orchestrator->wait_idle();
    REQUIRE(handle->content() == "a");
    REQUIRE(f.store.assistant_messages("s1").empty());
    REQUIRE(f.log->cancelled.size() == 1);
    REQUIRE(f.log->cancelled[0].partial_response.value_or("") == "a");
    REQUIRE(f.log->failed.empty());
    REQUIRE(f.log->completed.empty());
}

TEST_CASE("StreamOrchestrator: stop on unknown session is a no-op", "[orchestrator]") {
    Fixture f;
    REQUIRE_FALSE(f.orchestrator->stop_stream("nobody"));
}

TEST_CASE("StreamOrchestrator: persist_cancelled stores the partial reply", "[orchestrator]") {
    Fixture f(20, true);
    f.hold_all({"a", "b"}, 1);

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.provider.wait_until_held(1));
    f.orchestrator->stop_stream("s1");
    f.orchestrator->wait_idle();

    auto replies = f.store.assistant_messages("s1");
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0].content == "a\n\nResponse cancelled.");
    REQUIRE(replies[0].failed);
}

TEST_CASE("StreamOrchestrator: persist_cancelled skips empty replies", "[orchestrator]") {
    Fixture f(20, true);
    f.hold_all({"a"}, 0);

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.provider.wait_until_held(1));
    f.orchestrator->stop_stream("s1");
    f.orchestrator->wait_idle();

    REQUIRE(f.store.assistant_messages("s1").empty());
}

TEST_CASE("StreamOrchestrator: stopped task does not remove its successor", "[orchestrator]") {
    Fixture f;
    ScriptedProvider::Script first;
    first.tokens = {"old"};
    first.hold = true;
    first.hold_after = 1;
    f.provider.script_for("first", first);

    REQUIRE(f.orchestrator->send_message("s1", "first").ok());
    REQUIRE(f.provider.wait_until_held(1));
    REQUIRE(f.orchestrator->stop_stream("s1"));

    ScriptedProvider::Script second;
    second.tokens = {"new"};
    second.hold = true;
    second.hold_after = 0;
    f.provider.script_for("second", second);

    auto result = f.orchestrator->send_message("s1", "second");
    REQUIRE(result.ok());
    REQUIRE(f.provider.wait_until_held(2));

    // The first task has observed its cancellation by now or will soon;
    // either way the registry still points at the second handle.
    auto handle = f.orchestrator->get_active_thread("s1");
    REQUIRE(handle != nullptr);
    REQUIRE(handle->thread_id() == *result.thread_id);

    f.provider.release();
    f.orchestrator->wait_idle();
    auto replies = f.store.assistant_messages("s1");
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0].content == "new");
}

// ── Stop while saving ───────────────────────────────────────────

namespace {

// MemoryChatStore whose selected writes wait for unpark().
class ParkingStore : public MemoryChatStore {
public:
    bool park_replies = false;
    bool park_user_messages = false;
    bool reject_user_messages = false; // throw after parking

    StoredMessage record_user_message(const std::string& session_id,
                                      const std::string& content) override {
        if (park_user_messages) park();
        if (reject_user_messages) throw std::runtime_error("disk full");
        return MemoryChatStore::record_user_message(session_id, content);
    }

    StoredMessage save_assistant_response(const std::string& session_id,
                                          const std::string& content,
                                          bool failed) override {
        if (park_replies) park();
        return MemoryChatStore::save_assistant_response(session_id, content, failed);
    }

    bool wait_parked(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(park_mutex_);
        return park_cv_.wait_for(lock, timeout, [this] { return parked_; });
    }

    void unpark() {
        {
            std::lock_guard<std::mutex> lock(park_mutex_);
            released_ = true;
        }
        park_cv_.notify_all();
    }

private:
    void park() {
        std::unique_lock<std::mutex> lock(park_mutex_);
        parked_ = true;
        park_cv_.notify_all();
        park_cv_.wait_for(lock, std::chrono::seconds(10), [this] { return released_; });
    }

    std::mutex park_mutex_;
    std::condition_variable park_cv_;
    bool parked_ = false;
    bool released_ = false;
};

struct ParkingFixture {
    ScriptedProvider provider;
    ParkingStore store;
    EventBus bus;
    Config config;
    std::unique_ptr<EventLog> log;
    std::unique_ptr<StreamOrchestrator> orchestrator;

    ParkingFixture() {
        config.streaming.worker_threads = 2;
        log = std::make_unique<EventLog>(bus);
        orchestrator = std::make_unique<StreamOrchestrator>(provider, store, bus, config);
    }

    ~ParkingFixture() {
        store.unpark();
        provider.release();
        orchestrator->shutdown();
    }
};

} // namespace

TEST_CASE("StreamOrchestrator: stop during the final save keeps the completed reply", "[orchestrator]") {
    ParkingFixture f;
    f.provider.default_script.tokens = {"Hel", "lo"};
    f.store.park_replies = true;

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.store.wait_parked());
    auto handle = f.orchestrator->get_active_thread("s1");
    REQUIRE(handle != nullptr);

    std::mutex m;
    std::optional<StreamState> finished;
    std::optional<StoredMessage> saved_at_finish;
    auto sub = handle->subscribe([](const std::string&) {},
        [&](StreamState state) {
            std::lock_guard<std::mutex> lock(m);
            finished = state;
            saved_at_finish = handle->saved_message();
        });

    REQUIRE(f.orchestrator->stop_stream("s1"));
    REQUIRE(f.orchestrator->get_active_thread("s1") == nullptr);
    REQUIRE(handle->state() == StreamState::Streaming);

    f.store.unpark();
    f.orchestrator->wait_idle();

    REQUIRE(handle->state() == StreamState::Completed);
    REQUIRE(finished == StreamState::Completed);
    REQUIRE(saved_at_finish.has_value());
    REQUIRE(saved_at_finish->content == "Hello");

    auto replies = f.store.assistant_messages("s1");
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0].content == "Hello");
    REQUIRE_FALSE(replies[0].failed);

    REQUIRE(f.log->completed.size() == 1);
    REQUIRE(f.log->cancelled.empty());
    REQUIRE(f.log->failed.empty());
}

TEST_CASE("StreamOrchestrator: stop during a failure save keeps the failure", "[orchestrator]") {
    ParkingFixture f;
    f.provider.default_script.tokens = {"x"};
    f.provider.default_script.error = "boom";
    f.store.park_replies = true;

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.store.wait_parked());
    auto handle = f.orchestrator->get_active_thread("s1");
    REQUIRE(handle != nullptr);

    REQUIRE(f.orchestrator->stop_stream("s1"));
    f.store.unpark();
    f.orchestrator->wait_idle();

    REQUIRE(handle->state() == StreamState::Failed);
    REQUIRE(f.store.assistant_messages("s1")[0].content == "x\n\nResponse failed: boom");
    REQUIRE(f.log->failed.size() == 1);
    REQUIRE(f.log->cancelled.empty());
}

TEST_CASE("StreamOrchestrator: failed send still finishes its handle", "[orchestrator]") {
    ParkingFixture f;
    f.store.park_user_messages = true;
    f.store.reject_user_messages = true;

    SendResult result;
    std::thread sender([&]() { result = f.orchestrator->send_message("s1", "hi"); });
    REQUIRE(f.store.wait_parked());

    // An observer that found the handle before the send gave up
    auto handle = f.orchestrator->get_active_thread("s1");
    REQUIRE(handle != nullptr);
    std::mutex m;
    std::vector<StreamState> finished;
    auto sub = handle->subscribe([](const std::string&) {},
        [&](StreamState state) {
            std::lock_guard<std::mutex> lock(m);
            finished.push_back(state);
        });

    f.store.unpark();
    sender.join();

    REQUIRE(result.error == SendError::PersistenceFailure);
    REQUIRE(handle->state() == StreamState::Failed);
    REQUIRE(finished == std::vector<StreamState>{StreamState::Failed});
    REQUIRE(f.orchestrator->get_active_thread("s1") == nullptr);
    REQUIRE(f.provider.call_count() == 0);
}

// ── Bounds ──────────────────────────────────────────────────────

TEST_CASE("StreamOrchestrator: global bound rejects extra sessions", "[orchestrator]") {
    Fixture f(3);
    f.hold_all({"x"});

    for (int i = 0; i < 3; i++) {
        REQUIRE(f.orchestrator->send_message("s" + std::to_string(i), "hi").ok());
    }
    auto rejected = f.orchestrator->send_message("s3", "hi");
    REQUIRE(rejected.error == SendError::CapacityExceeded);
    REQUIRE(f.orchestrator->active_count() == 3);
    REQUIRE_FALSE(f.store.session_exists("s3"));

    f.provider.release();
    f.orchestrator->wait_idle();
    REQUIRE(f.orchestrator->active_count() == 0);
    REQUIRE(f.orchestrator->send_message("s3", "hi").ok());
}

TEST_CASE("StreamOrchestrator: concurrent sends to one session yield one winner", "[orchestrator]") {
    Fixture f;
    f.hold_all({"x"});

    constexpr int kThreads = 16;
    std::atomic<int> ok{0};
    std::atomic<int> busy{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&]() {
            auto r = f.orchestrator->send_message("same", "hi");
            if (r.ok()) ok++;
            else if (r.error == SendError::SessionBusy) busy++;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(ok.load() == 1);
    REQUIRE(busy.load() == kThreads - 1);
    REQUIRE(f.orchestrator->active_count() == 1);
}

TEST_CASE("StreamOrchestrator: bound holds under concurrent distinct sessions", "[orchestrator]") {
    Fixture f(5);
    f.hold_all({"x"});

    constexpr int kThreads = 40;
    std::atomic<int> ok{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&, i]() {
            auto r = f.orchestrator->send_message("s" + std::to_string(i), "hi");
            if (r.ok()) ok++;
            else if (r.error == SendError::CapacityExceeded) rejected++;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(ok.load() == 5);
    REQUIRE(rejected.load() == kThreads - 5);
    REQUIRE(f.orchestrator->active_count() == 5);
    REQUIRE(f.orchestrator->active_sessions().size() == 5);
}

// ── Shutdown ────────────────────────────────────────────────────

TEST_CASE("StreamOrchestrator: shutdown cancels everything", "[orchestrator]") {
    Fixture f;
    f.hold_all({"a"}, 1);

    REQUIRE(f.orchestrator->send_message("s1", "hi").ok());
    REQUIRE(f.orchestrator->send_message("s2", "hi").ok());
    REQUIRE(f.provider.wait_until_held(2));

    f.orchestrator->shutdown();
    REQUIRE(f.orchestrator->active_count() == 0);
    REQUIRE(f.log->cancelled.size() == 2);
    REQUIRE(f.log->completed.empty());

    auto late = f.orchestrator->send_message("s3", "hi");
    REQUIRE(late.error == SendError::ShuttingDown);

    f.orchestrator->shutdown(); // idempotent
}

TEST_CASE("send_error_message: user-facing text", "[orchestrator]") {
    REQUIRE(std::string(send_error_message(SendError::None)).empty());
    REQUIRE(std::string(send_error_message(SendError::SessionBusy)).find("already") !=
            std::string::npos);
    REQUIRE_FALSE(std::string(send_error_message(SendError::CapacityExceeded)).empty());
}
