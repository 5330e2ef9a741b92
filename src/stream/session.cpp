#include "session.hpp"
#include "event_stream.hpp"
#include "../util.hpp"

#include <iostream>
#include <stdexcept>
#include <algorithm>

namespace kbchat {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Closes the response stream when the reader loop exits, whichever way.
class StreamReleaser {
public:
    explicit StreamReleaser(std::unique_ptr<ByteStream>& stream) : stream_(stream) {}
    ~StreamReleaser() {
        if (stream_) {
            stream_->close();
            stream_.reset();
        }
    }
    StreamReleaser(const StreamReleaser&) = delete;
    StreamReleaser& operator=(const StreamReleaser&) = delete;

private:
    std::unique_ptr<ByteStream>& stream_;
};

std::string http_error_message(const OpenResult& opened) {
    if (opened.status_code == 0) {
        return "Connection failed: " +
               (opened.error.empty() ? std::string("no response") : opened.error);
    }
    return "HTTP error! status: " + std::to_string(opened.status_code);
}

} // namespace

// ── TurnHandle ───────────────────────────────────────────────────

TurnHandle::TurnHandle(Turn turn, StreamRequest request, StreamTransport& transport,
                       const SessionOptions& options, Clock clock, FinishCallback on_finish)
    : slot_(turn.slot), request_(std::move(request)), transport_(transport),
      options_(options), on_finish_(std::move(on_finish)),
      machine_(std::move(turn), options.chunk_filter, std::move(clock), options.dev) {}

TurnHandle::~TurnHandle() {
    cancel_requested_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (!worker_.joinable()) return;
    // The reader loop holds a reference to the handle, so the last owner
    // may be the loop itself on its way out.
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

void TurnHandle::launch() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable()) return;
    auto self = shared_from_this();
    worker_ = std::thread([self]() { self->run(); });
}

void TurnHandle::cancel() {
    cancel_requested_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
        const bool want_copy = observed();
        Turn snap;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            changed = machine_.cancel();
            if (changed && want_copy) snap = machine_.turn();
        }
        if (changed && want_copy) notify(snap);
    }

    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

uint64_t TurnHandle::on_update(TurnUpdateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    uint64_t id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

bool TurnHandle::remove_update(uint64_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == callbacks_.end()) return false;
    callbacks_.erase(it);
    return true;
}

Turn TurnHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.turn();
}

void TurnHandle::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this]() { return loop_finished_; });
}

bool TurnHandle::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this]() { return loop_finished_; });
}

bool TurnHandle::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !loop_finished_ && !is_terminal(machine_.status());
}

bool TurnHandle::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loop_finished_;
}

bool TurnHandle::terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_terminal(machine_.status());
}

bool TurnHandle::observed() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    return !callbacks_.empty();
}

void TurnHandle::apply(const ParsedEvent& event) {
    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    // No copy of the turn is taken while nobody is watching
    const bool want_copy = observed();
    Turn snap;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = machine_.apply(event);
        if (changed && want_copy) snap = machine_.turn();
    }
    if (changed && want_copy) notify(snap);
}

void TurnHandle::notify(const Turn& turn) {
    // Copy so callbacks may register or remove observers
    std::vector<TurnUpdateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks.reserve(callbacks_.size());
        for (const auto& entry : callbacks_) callbacks.push_back(entry.second);
    }
    for (const auto& cb : callbacks) {
        cb(turn);
    }
}

void TurnHandle::finish_loop() {
    Turn final_turn = snapshot();
    if (on_finish_) {
        try {
            on_finish_(final_turn);
        } catch (const std::exception& e) {
            std::cerr << "[session] Failed to record turn " << final_turn.id
                      << ": " << e.what() << "\n";
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_finished_ = true;
    }
    done_cv_.notify_all();
}

void TurnHandle::run() {
    std::unique_ptr<ByteStream> stream;
    try {
        StreamReleaser releaser(stream);

        if (!cancelled()) {
            OpenResult opened = transport_.open(request_, &cancel_requested_);
            const bool opened_ok = opened.ok();
            stream = std::move(opened.stream);

            if (cancelled()) {
                // Dropped on the way out by the releaser
            } else if (!opened_ok) {
                if (!opened.body.empty() && options_.dev) {
                    std::cerr << "[session] " << request_.url << " returned "
                              << opened.status_code << ": " << opened.body << "\n";
                }
                apply(make_error_event(http_error_message(opened)));
            } else {
                EventStream events;
                auto last_activity = SteadyClock::now();

                while (!cancelled()) {
                    EventStream::Pulled pulled = events.pull(*stream, options_.poll_interval);
                    if (cancelled()) break; // nothing read after a stop is applied

                    for (const auto& event : pulled.events) {
                        apply(event);
                    }
                    if (terminal()) break;

                    if (pulled.status == PullResult::Status::Lines) {
                        last_activity = SteadyClock::now();
                    } else if (pulled.status == PullResult::Status::Timeout) {
                        if (SteadyClock::now() - last_activity >= options_.idle_timeout) {
                            apply(make_error_event("Stream idle timeout"));
                            break;
                        }
                    } else if (pulled.status == PullResult::Status::End) {
                        apply(make_error_event("Connection closed before the stream completed"));
                        break;
                    } else {
                        // Error: the synthesized error event was already applied
                        break;
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[session] Stream processing error: " << e.what() << "\n";
        apply(make_error_event(std::string("Stream processing error: ") + e.what()));
    }

    finish_loop();
}

// ── StreamSessionController ──────────────────────────────────────

StreamSessionController::StreamSessionController(StreamTransport& transport,
                                                 SessionOptions options, Clock clock)
    : transport_(transport), options_(std::move(options)),
      clock_(clock ? std::move(clock) : system_clock()) {}

StreamSessionController::~StreamSessionController() {
    cancel_all();
}

std::vector<HistoryMessage>
StreamSessionController::conversation_of(const Slot& slot) const {
    std::vector<HistoryMessage> messages;
    for (const auto& turn : slot.history) {
        if (turn.status != TurnStatus::Completed) continue;
        messages.push_back({"user", turn.input, turn.created_at});
        messages.push_back({"assistant", turn.content, turn.created_at});
    }
    return messages;
}

std::shared_ptr<TurnHandle> StreamSessionController::start_turn(const std::string& slot,
                                                                const std::string& input,
                                                                const ChatOptions& options) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Cancel and join the previous turn until its loop has recorded it into
    // the slot. The lock is dropped meanwhile for that record.
    while (true) {
        auto previous = slots_[slot].active;
        if (!previous || previous->finished()) break;
        lock.unlock();
        previous->cancel();
        lock.lock();
        if (slots_[slot].active == previous) break;
    }

    Slot& state = slots_[slot];
    StreamRequest request = build_stream_request(options_.base_url, input, state.backend_session,
                                                 options, conversation_of(state),
                                                 options_.connect_timeout_seconds);

    Turn turn;
    turn.id = generate_id();
    turn.slot = slot;
    turn.input = input;
    turn.created_at = timestamp_now();
    if (state.backend_session) turn.session_id = *state.backend_session;

    auto handle = std::make_shared<TurnHandle>(
        std::move(turn), std::move(request), transport_, options_, clock_,
        [this, slot](const Turn& finished) { record_finished(slot, finished); });
    state.active = handle;
    handle->launch();
    return handle;
}

std::shared_ptr<TurnHandle> StreamSessionController::active_turn(const std::string& slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(slot);
    if (it == slots_.end() || !it->second.active) return nullptr;
    if (!it->second.active->active()) return nullptr;
    return it->second.active;
}

bool StreamSessionController::cancel(const std::string& slot) {
    std::shared_ptr<TurnHandle> handle = active_turn(slot);
    if (!handle) return false;
    handle->cancel();
    return true;
}

void StreamSessionController::cancel_all() {
    std::vector<std::shared_ptr<TurnHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, state] : slots_) {
            if (state.active) handles.push_back(state.active);
        }
    }
    for (auto& handle : handles) {
        handle->cancel();
    }
}

std::vector<Turn> StreamSessionController::history(const std::string& slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(slot);
    if (it == slots_.end()) return {};
    return it->second.history;
}

void StreamSessionController::clear_history(const std::string& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(slot);
    if (it == slots_.end()) return;
    it->second.history.clear();
    it->second.backend_session.reset();
}

std::optional<std::string> StreamSessionController::session_id(const std::string& slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(slot);
    if (it == slots_.end()) return std::nullopt;
    return it->second.backend_session;
}

std::vector<std::string> StreamSessionController::list_slots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(slots_.size());
    for (const auto& [name, state] : slots_) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

void StreamSessionController::record_finished(const std::string& slot, const Turn& turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& state = slots_[slot];
    if (!turn.session_id.empty()) state.backend_session = turn.session_id;
    state.history.push_back(turn);
    if (options_.max_history_turns > 0 && state.history.size() > options_.max_history_turns) {
        state.history.erase(state.history.begin(),
                            state.history.begin() +
                                static_cast<std::ptrdiff_t>(state.history.size() -
                                                            options_.max_history_turns));
    }
}

} // namespace kbchat
