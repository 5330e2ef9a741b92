#pragma once
#include "turn.hpp"
#include "../http.hpp"
#include "../request.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <optional>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstdint>

namespace kbchat {

// Receives a copy of the turn after every state change.
using TurnUpdateCallback = std::function<void(const Turn& turn)>;

struct SessionOptions {
    std::string base_url = "http://localhost:3002";
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds poll_interval{100};
    long connect_timeout_seconds = 30;
    ChunkFilter chunk_filter;
    size_t max_history_turns = 50; // finished turns retained per slot
    bool dev = false;              // log ignored unknown events
};

// One in-flight turn: a reader loop on its own thread feeding a
// TurnStateMachine. Only the loop applies stream events; cancel() is the
// single outside transition. Snapshots may be taken from any thread.
class TurnHandle : public std::enable_shared_from_this<TurnHandle> {
public:
    using FinishCallback = std::function<void(const Turn& turn)>;

    TurnHandle(Turn turn, StreamRequest request, StreamTransport& transport,
               const SessionOptions& options, Clock clock, FinishCallback on_finish);
    ~TurnHandle();

    TurnHandle(const TurnHandle&) = delete;
    TurnHandle& operator=(const TurnHandle&) = delete;

    // Start the reader loop. Called once by the controller.
    void launch();

    // Stop pulling, mark the turn Cancelled (if not yet terminal) and wait
    // for the reader loop to release the connection. When called from an
    // update callback the loop is not awaited; it exits right after.
    void cancel();

    // Register an update callback. Returns an id for remove_update().
    uint64_t on_update(TurnUpdateCallback callback);
    bool remove_update(uint64_t id);

    Turn snapshot() const;

    // Block until the reader loop has exited.
    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

    // True while the reader loop is running and the turn is not terminal.
    bool active() const;

    // True once the reader loop has released the stream and the finished
    // turn has been handed to the controller.
    bool finished() const;

    const std::string& slot() const { return slot_; }

private:
    void run();
    bool cancelled() const { return cancel_requested_.load(std::memory_order_acquire); }
    bool terminal() const;
    bool observed();

    // Apply under the turn lock, then notify observers outside it.
    void apply(const ParsedEvent& event);
    void notify(const Turn& turn);
    void finish_loop();

    const std::string slot_;
    StreamRequest request_;
    StreamTransport& transport_;
    SessionOptions options_;
    FinishCallback on_finish_;

    mutable std::mutex mutex_; // guards machine_ and loop_finished_
    mutable std::condition_variable done_cv_;
    TurnStateMachine machine_;
    bool loop_finished_ = false;
    std::atomic<bool> cancel_requested_{false};

    // Serializes state changes with their notifications so observers see
    // snapshots in state order. Recursive: callbacks may call cancel().
    std::recursive_mutex notify_mutex_;
    std::mutex callbacks_mutex_;
    std::vector<std::pair<uint64_t, TurnUpdateCallback>> callbacks_;
    uint64_t next_callback_id_ = 1;

    std::mutex join_mutex_;
    std::thread worker_;
};

// Owns conversation slots. Each slot has at most one streaming turn, a
// retained history of finished turns, and the backend session id learned
// from the last start event.
class StreamSessionController {
public:
    StreamSessionController(StreamTransport& transport, SessionOptions options,
                            Clock clock = system_clock());
    ~StreamSessionController();

    StreamSessionController(const StreamSessionController&) = delete;
    StreamSessionController& operator=(const StreamSessionController&) = delete;

    // Open a new turn on slot. A turn still streaming on that slot is
    // cancelled, and its reader released, before the request is issued.
    // Throws std::invalid_argument if the base URL is not configured.
    std::shared_ptr<TurnHandle> start_turn(const std::string& slot,
                                           const std::string& input,
                                           const ChatOptions& options);

    // Active (streaming or pending) turn of a slot, or nullptr
    std::shared_ptr<TurnHandle> active_turn(const std::string& slot) const;

    // Cancel the slot's active turn. Returns true if there was one.
    bool cancel(const std::string& slot);
    void cancel_all();

    // Finished turns of a slot, oldest first
    std::vector<Turn> history(const std::string& slot) const;
    void clear_history(const std::string& slot);

    std::optional<std::string> session_id(const std::string& slot) const;
    std::vector<std::string> list_slots() const;

    const SessionOptions& options() const { return options_; }

private:
    struct Slot {
        std::shared_ptr<TurnHandle> active;
        std::vector<Turn> history;
        std::optional<std::string> backend_session;
    };

    void record_finished(const std::string& slot, const Turn& turn);
    std::vector<HistoryMessage> conversation_of(const Slot& slot) const;

    StreamTransport& transport_;
    SessionOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};

} // namespace kbchat
