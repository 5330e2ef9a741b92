#include "frame_assembler.hpp"
#include "../util.hpp"

namespace kbchat {

std::optional<EventFrame> FrameAssembler::take_frame() {
    std::optional<EventFrame> frame;
    if (has_data_) {
        frame = EventFrame{current_kind_.empty() ? kDefaultFrameKind : current_kind_,
                           current_data_};
    }
    current_kind_.clear();
    current_data_.clear();
    has_data_ = false;
    return frame;
}

std::optional<EventFrame> FrameAssembler::push_line(const std::string& line) {
    if (line.empty()) {
        // Empty line = dispatch event
        return take_frame();
    }

    if (starts_with(line, "event:")) {
        std::string kind = trim(line.substr(6));
        // A kind change is always a frame boundary
        std::optional<EventFrame> closed;
        if (has_data_) closed = take_frame();
        current_kind_ = kind;
        return closed;
    }

    if (starts_with(line, "data:")) {
        if (has_data_) {
            current_data_ += '\n';
        }
        // Handle both "data: payload" (with space) and "data:payload" (without)
        current_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        has_data_ = true;
    }
    // Ignore other lines (comments starting with :, id:, retry:)
    return std::nullopt;
}

std::optional<EventFrame> FrameAssembler::flush() {
    return take_frame();
}

void FrameAssembler::reset() {
    current_kind_.clear();
    current_data_.clear();
    has_data_ = false;
}

} // namespace kbchat
