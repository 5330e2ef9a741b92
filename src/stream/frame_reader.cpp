#include "frame_reader.hpp"

namespace kbchat {

void FrameReader::split_lines(std::vector<std::string>& out) {
    size_t start = 0;
    size_t newline;
    while ((newline = line_buffer_.find('\n', start)) != std::string::npos) {
        std::string line = line_buffer_.substr(start, newline - start);
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out.push_back(std::move(line));
        start = newline + 1;
    }
    line_buffer_.erase(0, start);
}

std::vector<std::string> FrameReader::feed(const std::string& bytes) {
    std::vector<std::string> lines;
    line_buffer_ += decoder_.decode(bytes);
    split_lines(lines);
    return lines;
}

std::vector<std::string> FrameReader::finish() {
    std::vector<std::string> lines;
    line_buffer_ += decoder_.finish();
    split_lines(lines);
    if (!line_buffer_.empty()) {
        std::string line = std::move(line_buffer_);
        if (line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        line_buffer_.clear();
    }
    return lines;
}

PullResult FrameReader::pull(ByteStream& stream, std::chrono::milliseconds wait) {
    PullResult result;
    if (closed_) {
        result.status = PullResult::Status::End;
        return result;
    }

    ReadResult r = stream.read(wait);
    switch (r.status) {
        case ReadStatus::Data:
            result.status = PullResult::Status::Lines;
            result.lines = feed(r.data);
            break;
        case ReadStatus::Timeout:
            result.status = PullResult::Status::Timeout;
            break;
        case ReadStatus::EndOfStream:
            result.status = PullResult::Status::End;
            result.lines = finish();
            closed_ = true;
            break;
        case ReadStatus::Error:
            result.status = PullResult::Status::Error;
            result.error = make_error_event(
                "Connection error: " + (r.error.empty() ? std::string("read failed") : r.error));
            closed_ = true;
            break;
    }
    return result;
}

void FrameReader::reset() {
    decoder_.reset();
    line_buffer_.clear();
    closed_ = false;
}

} // namespace kbchat
