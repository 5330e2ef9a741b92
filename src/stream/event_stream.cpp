#include "event_stream.hpp"
#include "event_decoder.hpp"

namespace kbchat {

void EventStream::emit(const EventFrame& frame, std::vector<ParsedEvent>& out) {
    for (auto& ev : decode_frame(frame)) {
        out.push_back(std::move(ev));
    }
}

void EventStream::dispatch(const std::vector<std::string>& lines,
                           std::vector<ParsedEvent>& out) {
    for (const auto& line : lines) {
        if (auto frame = assembler_.push_line(line)) {
            emit(*frame, out);
        }
    }
}

std::vector<ParsedEvent> EventStream::feed(const std::string& bytes) {
    std::vector<ParsedEvent> events;
    dispatch(reader_.feed(bytes), events);
    return events;
}

std::vector<ParsedEvent> EventStream::finish() {
    std::vector<ParsedEvent> events;
    dispatch(reader_.finish(), events);
    if (auto frame = assembler_.flush()) {
        emit(*frame, events);
    }
    return events;
}

EventStream::Pulled EventStream::pull(ByteStream& stream, std::chrono::milliseconds wait) {
    PullResult r = reader_.pull(stream, wait);
    Pulled out;
    out.status = r.status;
    dispatch(r.lines, out.events);
    if (r.status == PullResult::Status::End) {
        if (auto frame = assembler_.flush()) {
            emit(*frame, out.events);
        }
    } else if (r.status == PullResult::Status::Error && r.error) {
        out.events.push_back(std::move(*r.error));
    }
    return out;
}

void EventStream::reset() {
    reader_.reset();
    assembler_.reset();
}

} // namespace kbchat
