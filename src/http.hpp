#pragma once
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <utility>
#include <atomic>

namespace kbchat {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct StreamRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long connect_timeout_seconds = 30;
};

enum class ReadStatus {
    Data,        // data holds one or more body bytes
    EndOfStream, // body finished cleanly
    Timeout,     // nothing arrived within the wait window
    Error        // unrecoverable; error holds a description
};

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string data;
    std::string error;
};

// Pull-based view of a response body. Transfer encoding is already removed.
// Not thread-safe: one reader loop owns a stream.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Block for at most `wait` until body bytes, end of stream, or an error.
    virtual ReadResult read(std::chrono::milliseconds wait) = 0;

    // Release the underlying connection. Reads after close() return Error.
    virtual void close() = 0;
};

struct OpenResult {
    long status_code = 0;              // 0 when no response was received
    std::unique_ptr<ByteStream> stream; // set only for 2xx responses
    std::string error;                 // connection failure description
    std::string body;                  // error body for non-2xx responses

    bool ok() const { return stream != nullptr; }
};

// Opens streaming POST requests (injectable for testing)
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    // Send the request and read the response head. When abort becomes true
    // while connecting, returns promptly without a stream.
    virtual OpenResult open(const StreamRequest& request,
                            const std::atomic<bool>* abort) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketStreamTransport : public StreamTransport {
public:
    OpenResult open(const StreamRequest& request,
                    const std::atomic<bool>* abort) override;
};
using PlatformStreamTransport = SocketStreamTransport;

#else

// Other platforms: libcurl multi interface
class CurlStreamTransport : public StreamTransport {
public:
    OpenResult open(const StreamRequest& request,
                    const std::atomic<bool>* abort) override;
};
using PlatformStreamTransport = CurlStreamTransport;

#endif

} // namespace kbchat
