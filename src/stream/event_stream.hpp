#pragma once
#include "event.hpp"
#include "frame_reader.hpp"
#include "frame_assembler.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace kbchat {

// Frame Reader -> Frame Assembler -> Event Decoder, bytes in, events out.
// Events come out in exactly the order their frames were completed.
class EventStream {
public:
    struct Pulled {
        PullResult::Status status = PullResult::Status::Timeout;
        std::vector<ParsedEvent> events;
    };

    // Push-style
    std::vector<ParsedEvent> feed(const std::string& bytes);
    std::vector<ParsedEvent> finish();

    // Pull-style; on End the open frame is flushed, on Error the synthesized
    // Error event is the last event returned.
    Pulled pull(ByteStream& stream, std::chrono::milliseconds wait);

    // Bytes of the current partial line
    size_t buffered() const { return reader_.line_buffer().size(); }

    void reset();

private:
    void dispatch(const std::vector<std::string>& lines, std::vector<ParsedEvent>& out);
    void emit(const EventFrame& frame, std::vector<ParsedEvent>& out);

    FrameReader reader_;
    FrameAssembler assembler_;
};

} // namespace kbchat
