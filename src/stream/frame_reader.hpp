#pragma once
#include "event.hpp"
#include "utf8_decoder.hpp"
#include "../http.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace kbchat {

struct PullResult {
    enum class Status {
        Lines,   // zero or more complete lines (bytes may still be buffered)
        Timeout, // nothing arrived within the wait window
        End,     // end of stream; lines holds the flushed remainder
        Error    // transport failure; error holds the synthesized Error event
    };

    Status status = Status::Timeout;
    std::vector<std::string> lines;
    std::optional<ParsedEvent> error;
};

// Turns raw body bytes into complete text lines.
//
// The line buffer always holds exactly the decoded text after the last
// '\n' seen so far. A trailing '\r' is stripped from each line. The reader
// never owns the stream it pulls from; releasing it is the caller's job.
class FrameReader {
public:
    // Push-style: decode bytes and return every line they complete.
    std::vector<std::string> feed(const std::string& bytes);

    // End of input: flush the remainder (if any) as a final line.
    std::vector<std::string> finish();

    // Pull-style: read once from stream (waiting at most `wait`).
    // After End or Error the reader is closed and further pulls return End.
    PullResult pull(ByteStream& stream, std::chrono::milliseconds wait);

    bool closed() const { return closed_; }
    const std::string& line_buffer() const { return line_buffer_; }

    // Start over for a new session.
    void reset();

private:
    void split_lines(std::vector<std::string>& out);

    Utf8Decoder decoder_;
    std::string line_buffer_;
    bool closed_ = false;
};

} // namespace kbchat
