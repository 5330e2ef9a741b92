#include <catch2/catch.hpp>
#include "stream/frame_reader.hpp"
#include "mock_transport.hpp"

using namespace kbchat;

using namespace std::chrono_literals;

// ── Push-style ───────────────────────────────────────────────────

TEST_CASE("FrameReader: complete lines are returned in order", "[frame_reader]") {
    FrameReader reader;
    auto lines = reader.feed("event: chunk\ndata: {}\n\n");
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == "event: chunk");
    REQUIRE(lines[1] == "data: {}");
    REQUIRE(lines[2].empty());
    REQUIRE(reader.line_buffer().empty());
}

TEST_CASE("FrameReader: partial line is carried over", "[frame_reader]") {
    FrameReader reader;
    REQUIRE(reader.feed("data: hel").empty());
    REQUIRE(reader.line_buffer() == "data: hel");

    auto lines = reader.feed("lo\nda");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "data: hello");
    REQUIRE(reader.line_buffer() == "da");
}

TEST_CASE("FrameReader: CRLF line endings are stripped", "[frame_reader]") {
    FrameReader reader;
    auto lines = reader.feed("data: x\r\n\r\n");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "data: x");
    REQUIRE(lines[1].empty());
}

TEST_CASE("FrameReader: CR and LF split across reads", "[frame_reader]") {
    FrameReader reader;
    REQUIRE(reader.feed("data: x\r").empty());
    auto lines = reader.feed("\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "data: x");
}

TEST_CASE("FrameReader: multi-byte character split across reads", "[frame_reader]") {
    FrameReader reader;
    REQUIRE(reader.feed("data: \xC3").empty());
    REQUIRE(reader.line_buffer() == "data: ");
    auto lines = reader.feed("\xA9\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "data: \xC3\xA9");
}

TEST_CASE("FrameReader: finish flushes unterminated remainder", "[frame_reader]") {
    FrameReader reader;
    reader.feed("data: tail");
    auto lines = reader.finish();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "data: tail");
    REQUIRE(reader.line_buffer().empty());
}

TEST_CASE("FrameReader: finish with empty buffer yields nothing", "[frame_reader]") {
    FrameReader reader;
    reader.feed("data: x\n");
    REQUIRE(reader.finish().empty());
}

// ── Pull-style ───────────────────────────────────────────────────

TEST_CASE("FrameReader: pull returns lines then end", "[frame_reader]") {
    auto probe = std::make_shared<MockStreamProbe>();
    MockByteStream stream({data_read("data: a\n\ndata: b"), end_read()}, probe);
    FrameReader reader;

    auto r1 = reader.pull(stream, 10ms);
    REQUIRE(r1.status == PullResult::Status::Lines);
    REQUIRE(r1.lines.size() == 2);

    auto r2 = reader.pull(stream, 10ms);
    REQUIRE(r2.status == PullResult::Status::End);
    REQUIRE(r2.lines.size() == 1);
    REQUIRE(r2.lines[0] == "data: b");
    REQUIRE(reader.closed());

    // Closed readers do not touch the stream again
    int reads = probe->read_count.load();
    REQUIRE(reader.pull(stream, 10ms).status == PullResult::Status::End);
    REQUIRE(probe->read_count.load() == reads);
}

TEST_CASE("FrameReader: pull reports timeout without data", "[frame_reader]") {
    auto probe = std::make_shared<MockStreamProbe>();
    MockByteStream stream({timeout_read()}, probe);
    FrameReader reader;

    auto r = reader.pull(stream, 10ms);
    REQUIRE(r.status == PullResult::Status::Timeout);
    REQUIRE(r.lines.empty());
    REQUIRE_FALSE(reader.closed());
}

TEST_CASE("FrameReader: read error becomes a synthesized error event", "[frame_reader]") {
    auto probe = std::make_shared<MockStreamProbe>();
    MockByteStream stream({error_read("connection reset")}, probe);
    FrameReader reader;

    auto r = reader.pull(stream, 10ms);
    REQUIRE(r.status == PullResult::Status::Error);
    REQUIRE(r.error.has_value());
    REQUIRE(r.error->kind == EventKind::Error);
    REQUIRE(r.error->message == "Connection error: connection reset");
    REQUIRE(reader.closed());
    // Releasing the stream is left to the owner
    REQUIRE(probe->close_count.load() == 0);
}

TEST_CASE("FrameReader: reset reopens the reader", "[frame_reader]") {
    auto probe = std::make_shared<MockStreamProbe>();
    MockByteStream stream({end_read()}, probe);
    FrameReader reader;
    reader.feed("partial");
    reader.pull(stream, 10ms);
    REQUIRE(reader.closed());

    reader.reset();
    REQUIRE_FALSE(reader.closed());
    REQUIRE(reader.line_buffer().empty());
}
