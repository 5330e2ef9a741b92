#pragma once
#include "event.hpp"
#include <string>
#include <optional>

namespace kbchat {

// Groups decoded lines into EventFrames.
//
//   event: <kind>   sets the kind of the frame being built; if a frame with
//                   data is already open it is closed first
//   data: <text>    appends to the payload ('\n' between lines)
//   <blank>         closes the current frame
//
// Comment lines (":...") and other fields (id:, retry:) are ignored. A frame
// that never received a data line is dropped, so stray blank lines and
// duplicate kind lines never produce empty frames.
class FrameAssembler {
public:
    // Feed one line (without terminator). Returns a frame when this line
    // closed one.
    std::optional<EventFrame> push_line(const std::string& line);

    // End of stream: close whatever frame is still open.
    std::optional<EventFrame> flush();

    // Reset parser state
    void reset();

private:
    std::optional<EventFrame> take_frame();

    std::string current_kind_;
    std::string current_data_;
    bool has_data_ = false;
};

} // namespace kbchat
