#include <catch2/catch.hpp>
#include "stream/session.hpp"
#include "mock_transport.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

using namespace kbchat;

using namespace std::chrono_literals;

namespace {

SessionOptions test_options() {
    SessionOptions opts;
    opts.base_url = "http://backend.test";
    opts.poll_interval = 5ms;
    opts.idle_timeout = 5s;
    return opts;
}

std::string sse(const std::string& kind, const std::string& payload) {
    return "event: " + kind + "\ndata: " + payload + "\n\n";
}

bool wait_until(const std::function<bool()>& pred,
                std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

MockResponse streaming(std::deque<ReadResult> script) {
    MockResponse r;
    r.status_code = 200;
    r.script = std::move(script);
    return r;
}

} // namespace

// ── Complete turns ───────────────────────────────────────────────

TEST_CASE("StreamSessionController: streams a turn to completion", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", R"({"turnId":"t1","sessionId":"s1"})")),
        data_read(sse("chunk", R"({"content":"Hel"})") + "event: chu"),
        data_read("nk\ndata: {\"content\":\"lo\"}\n\n"),
        data_read(sse("end", R"({"tokensUsed":3})")),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    REQUIRE(handle->wait_for(2s));

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Completed);
    REQUIRE(turn.content == "Hello");
    REQUIRE(turn.id == "t1");
    REQUIRE(turn.stats.tokens_used == 3);
    REQUIRE_FALSE(handle->active());
    REQUIRE(transport.probe(0)->close_count.load() == 1);
}

TEST_CASE("StreamSessionController: request targets the mode endpoint", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({data_read(sse("start", "{}") + sse("end", "{}"))});
    StreamSessionController sessions(transport, test_options());

    ChatOptions opts;
    opts.mode = StreamMode::Direct;
    sessions.start_turn("main", "question", opts)->wait();

    auto req = transport.request(0);
    REQUIRE(req.url == "http://backend.test/api/streaming-chat/direct");
    auto body = nlohmann::json::parse(req.body);
    REQUIRE(body["message"] == "question");
}

TEST_CASE("StreamSessionController: updates are delivered in order", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}")),
        data_read(sse("chunk", R"({"content":"a"})")),
        data_read(sse("chunk", R"({"content":"b"})")),
        data_read(sse("end", "{}")),
    });
    // Hold the request until the observer is registered
    std::promise<void> registered;
    std::shared_future<void> ready = registered.get_future().share();
    transport.before_open = [ready] { ready.wait(); };
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    std::vector<Turn> seen;
    std::mutex seen_mutex;
    handle->on_update([&](const Turn& t) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(t);
    });
    registered.set_value();
    handle->wait();

    std::lock_guard<std::mutex> lock(seen_mutex);
    REQUIRE(seen.size() == 4);
    REQUIRE(seen[0].status == TurnStatus::Streaming);
    REQUIRE(seen[1].content == "a");
    REQUIRE(seen[2].content == "ab");
    REQUIRE(seen[3].status == TurnStatus::Completed);
}

// ── Failure paths ────────────────────────────────────────────────

TEST_CASE("StreamSessionController: backend error fails the turn", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}") + sse("chunk", R"({"content":"partial"})")),
        data_read(sse("error", R"({"error":"upstream failure"})")),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    handle->wait();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Failed);
    REQUIRE(turn.content == "partial");
    REQUIRE(turn.error == "upstream failure");
    REQUIRE(transport.probe(0)->close_count.load() == 1);
}

TEST_CASE("StreamSessionController: non-2xx status fails the turn", "[session]") {
    MockTransport transport;
    transport.next_response.status_code = 503;
    transport.next_response.body = "busy";
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    handle->wait();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Failed);
    REQUIRE(turn.error == "HTTP error! status: 503");
}

TEST_CASE("StreamSessionController: connection failure fails the turn", "[session]") {
    MockTransport transport;
    transport.next_response.status_code = 0;
    transport.next_response.error = "connection refused";
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    handle->wait();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Failed);
    REQUIRE(turn.error == "Connection failed: connection refused");
}

TEST_CASE("StreamSessionController: end of body without end event", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}") + sse("chunk", R"({"content":"cut"})")),
        end_read(),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    handle->wait();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Failed);
    REQUIRE(turn.content == "cut");
    REQUIRE(turn.error == "Connection closed before the stream completed");
    REQUIRE(transport.probe(0)->close_count.load() == 1);
}

TEST_CASE("StreamSessionController: unterminated end frame still completes", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}") + sse("chunk", R"({"content":"x"})") +
                  "event: end\ndata: {}"),
        end_read(),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    handle->wait();
    REQUIRE(handle->snapshot().status == TurnStatus::Completed);
}

TEST_CASE("StreamSessionController: read error fails the turn", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}")),
        error_read("connection reset"),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    handle->wait();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Failed);
    REQUIRE(turn.error == "Connection error: connection reset");
    REQUIRE(transport.probe(0)->close_count.load() == 1);
}

TEST_CASE("StreamSessionController: idle stream times out", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({data_read(sse("start", "{}"))});
    auto opts = test_options();
    opts.idle_timeout = 60ms;
    StreamSessionController sessions(transport, opts);

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    REQUIRE(handle->wait_for(2s));

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Failed);
    REQUIRE(turn.error == "Stream idle timeout");
    REQUIRE(transport.probe(0)->close_count.load() == 1);
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("StreamSessionController: cancel keeps partial content and releases once", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}")),
        data_read(sse("chunk", R"({"content":"abc"})")),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    REQUIRE(wait_until([&] { return handle->snapshot().content == "abc"; }));

    handle->cancel();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Cancelled);
    REQUIRE(turn.content == "abc");
    REQUIRE(turn.stats.finalized);
    REQUIRE_FALSE(handle->active());
    REQUIRE(transport.probe(0)->close_count.load() == 1);

    // Idempotent
    handle->cancel();
    REQUIRE(transport.probe(0)->close_count.load() == 1);
    REQUIRE(handle->snapshot().status == TurnStatus::Cancelled);
}

TEST_CASE("StreamSessionController: no update after cancel returns", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({data_read(sse("start", "{}"))});
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    REQUIRE(wait_until([&] { return handle->snapshot().status == TurnStatus::Streaming; }));

    handle->cancel();
    std::atomic<int> updates{0};
    handle->on_update([&](const Turn&) { updates++; });
    std::this_thread::sleep_for(30ms);

    REQUIRE(updates.load() == 0);
    REQUIRE(handle->snapshot().status == TurnStatus::Cancelled);
}

TEST_CASE("StreamSessionController: cancel from an update callback", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}")),
        data_read(sse("chunk", R"({"content":"stop here"})")),
        data_read(sse("chunk", R"({"content":" never"})")),
        data_read(sse("end", "{}")),
    });
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    TurnHandle* raw = handle.get();
    handle->on_update([raw](const Turn& t) {
        if (t.content == "stop here") raw->cancel();
    });
    handle->wait();

    auto turn = handle->snapshot();
    REQUIRE(turn.status == TurnStatus::Cancelled);
    REQUIRE(turn.content == "stop here");
    REQUIRE(transport.probe(0)->close_count.load() == 1);
}

TEST_CASE("StreamSessionController: cancel by slot", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({data_read(sse("start", "{}"))});
    StreamSessionController sessions(transport, test_options());

    REQUIRE_FALSE(sessions.cancel("main"));
    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    REQUIRE(sessions.active_turn("main") == handle);

    REQUIRE(sessions.cancel("main"));
    REQUIRE(handle->snapshot().status == TurnStatus::Cancelled);
    REQUIRE(sessions.active_turn("main") == nullptr);
}

TEST_CASE("StreamSessionController: new turn preempts the active one", "[session]") {
    MockTransport transport;
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("chunk", R"({"content":"old"})")),
    }));
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("chunk", R"({"content":"new"})") + sse("end", "{}")),
    }));
    StreamSessionController sessions(transport, test_options());

    auto first = sessions.start_turn("main", "one", ChatOptions{});
    REQUIRE(wait_until([&] { return first->snapshot().content == "old"; }));

    auto second = sessions.start_turn("main", "two", ChatOptions{});

    // The first reader was released before the second request was issued
    REQUIRE(first->snapshot().status == TurnStatus::Cancelled);
    REQUIRE(transport.probe(0)->close_count.load() == 1);

    second->wait();
    REQUIRE(second->snapshot().content == "new");
    REQUIRE(second->snapshot().status == TurnStatus::Completed);
}

TEST_CASE("StreamSessionController: slots stream independently", "[session]") {
    MockTransport transport;
    transport.response_queue.push_back(streaming({data_read(sse("start", "{}"))}));
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("chunk", R"({"content":"b"})") + sse("end", "{}")),
    }));
    StreamSessionController sessions(transport, test_options());

    auto a = sessions.start_turn("a", "one", ChatOptions{});
    REQUIRE(wait_until([&] { return transport.call_count() == 1; }));
    auto b = sessions.start_turn("b", "two", ChatOptions{});
    b->wait();

    REQUIRE(b->snapshot().status == TurnStatus::Completed);
    REQUIRE(a->active());

    sessions.cancel_all();
    REQUIRE(a->snapshot().status == TurnStatus::Cancelled);
    REQUIRE(sessions.list_slots() == std::vector<std::string>{"a", "b"});
}

// ── History ──────────────────────────────────────────────────────

TEST_CASE("StreamSessionController: finished turns feed the next agent request", "[session]") {
    MockTransport transport;
    transport.response_queue.push_back(streaming({
        data_read(sse("start", R"({"sessionId":"backend-1"})") +
                  sse("chunk", R"({"content":"Paris"})") + sse("end", "{}")),
    }));
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("end", "{}")),
    }));
    StreamSessionController sessions(transport, test_options());

    ChatOptions opts;
    opts.mode = StreamMode::Agent;
    sessions.start_turn("main", "Capital of France?", opts)->wait();

    REQUIRE(sessions.history("main").size() == 1);
    REQUIRE(sessions.session_id("main") == std::optional<std::string>("backend-1"));

    sessions.start_turn("main", "And Spain?", opts)->wait();

    auto body = nlohmann::json::parse(transport.request(1).body);
    REQUIRE(body["sessionId"] == "backend-1");
    auto& conv = body["conversationHistory"];
    REQUIRE(conv.size() == 2);
    REQUIRE(conv[0]["role"] == "user");
    REQUIRE(conv[0]["content"] == "Capital of France?");
    REQUIRE(conv[1]["role"] == "assistant");
    REQUIRE(conv[1]["content"] == "Paris");
}

TEST_CASE("StreamSessionController: next turn waits for the previous one to be recorded", "[session]") {
    MockTransport transport;
    MockResponse first = streaming({
        data_read(sse("start", R"({"turnId":"t1","sessionId":"s1"})") +
                  sse("chunk", R"({"content":"Hello"})") + sse("end", "{}")),
    });
    // The turn reads Completed well before its connection is torn down
    first.close_delay = 300ms;
    transport.response_queue.push_back(first);
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("end", "{}")),
    }));
    StreamSessionController sessions(transport, test_options());

    auto a = sessions.start_turn("main", "hi", ChatOptions{});
    REQUIRE(wait_until([&] { return a->snapshot().status == TurnStatus::Completed; }));

    auto b = sessions.start_turn("main", "again", ChatOptions{});
    REQUIRE(a->finished());
    REQUIRE(transport.probe(0)->close_count.load() == 1);
    REQUIRE(b->wait_for(2s));

    auto body = nlohmann::json::parse(transport.request(1).body);
    REQUIRE(body["sessionId"] == "s1");
    auto& conv = body["conversationHistory"];
    REQUIRE(conv.size() == 2);
    REQUIRE(conv[0]["content"] == "hi");
    REQUIRE(conv[1]["content"] == "Hello");
}

TEST_CASE("TurnHandle: removed observer gets no further updates", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", "{}")),
        data_read(sse("chunk", R"({"content":"a"})")),
        data_read(sse("end", "{}")),
    });
    std::promise<void> registered;
    std::shared_future<void> ready = registered.get_future().share();
    transport.before_open = [ready] { ready.wait(); };
    StreamSessionController sessions(transport, test_options());

    auto handle = sessions.start_turn("main", "hi", ChatOptions{});
    std::atomic<int> removed_calls{0};
    std::atomic<int> kept_calls{0};
    uint64_t id = handle->on_update([&](const Turn&) { removed_calls++; });
    handle->on_update([&](const Turn&) { kept_calls++; });
    REQUIRE(handle->remove_update(id));
    REQUIRE_FALSE(handle->remove_update(id));
    registered.set_value();
    handle->wait();

    REQUIRE(removed_calls.load() == 0);
    REQUIRE(kept_calls.load() == 3);
}

TEST_CASE("StreamSessionController: failed turns are kept but not sent as context", "[session]") {
    MockTransport transport;
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("error", R"({"error":"boom"})")),
    }));
    transport.response_queue.push_back(streaming({
        data_read(sse("start", "{}") + sse("end", "{}")),
    }));
    StreamSessionController sessions(transport, test_options());

    sessions.start_turn("main", "first", ChatOptions{})->wait();
    sessions.start_turn("main", "second", ChatOptions{})->wait();

    auto history = sessions.history("main");
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].status == TurnStatus::Failed);

    auto body = nlohmann::json::parse(transport.request(1).body);
    REQUIRE(body["conversationHistory"].empty());
}

TEST_CASE("StreamSessionController: clear_history forgets the backend session", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({
        data_read(sse("start", R"({"sessionId":"s1"})") + sse("end", "{}")),
    });
    StreamSessionController sessions(transport, test_options());

    sessions.start_turn("main", "hi", ChatOptions{})->wait();
    REQUIRE(sessions.session_id("main").has_value());

    sessions.clear_history("main");
    REQUIRE(sessions.history("main").empty());
    REQUIRE_FALSE(sessions.session_id("main").has_value());
}

TEST_CASE("StreamSessionController: history retention is bounded", "[session]") {
    MockTransport transport;
    transport.next_response = streaming({data_read(sse("start", "{}") + sse("end", "{}"))});
    auto opts = test_options();
    opts.max_history_turns = 2;
    StreamSessionController sessions(transport, opts);

    for (int i = 0; i < 4; ++i) {
        sessions.start_turn("main", "msg" + std::to_string(i), ChatOptions{})->wait();
    }
    auto history = sessions.history("main");
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].input == "msg2");
    REQUIRE(history[1].input == "msg3");
}

TEST_CASE("StreamSessionController: empty base URL is rejected", "[session]") {
    MockTransport transport;
    auto opts = test_options();
    opts.base_url.clear();
    StreamSessionController sessions(transport, opts);

    REQUIRE_THROWS_AS(sessions.start_turn("main", "hi", ChatOptions{}), std::invalid_argument);
    REQUIRE(transport.call_count() == 0);
}
