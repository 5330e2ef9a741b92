// Linux HTTP/HTTPS streaming transport using POSIX sockets + OpenSSL.
// Implements the same public API as http_curl.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace kbchat {

void http_init() {}
void http_cleanup() {}

namespace {

constexpr ssize_t kWouldBlock = -2;
constexpr size_t kMaxErrorBody = 64 * 1024;

using SteadyClock = std::chrono::steady_clock;

bool aborted(const std::atomic<bool>* abort) {
    return abort && abort->load(std::memory_order_relaxed);
}

int millis_until(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("http_socket: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("http_socket: missing host in URL: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs,
                 const std::atomic<bool>* abort, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0) {
            error = "cannot resolve host " + url.host;
            return false;
        }

        auto deadline = SteadyClock::now() + std::chrono::seconds(timeout_secs);
        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour the timeout and abort flag.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                // Wait in short slices so an abort is noticed promptly
                while (!aborted(abort)) {
                    int wait_ms = std::min(millis_until(deadline), 200);
                    struct pollfd p{fd, POLLOUT, 0};
                    rc = ::poll(&p, 1, wait_ms);
                    if (rc > 0) {
                        int err = 0;
                        socklen_t elen = sizeof(err);
                        getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                        if (err == 0) {
                            fcntl(fd, F_SETFL, flags);
                            connected = true;
                        }
                        break;
                    }
                    if (rc < 0 && errno != EINTR) break;
                    if (millis_until(deadline) == 0) break;
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (aborted(abort)) {
            error = "aborted";
            return false;
        }
        if (!connected) {
            error = "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so a blocking SSL_read after poll() never stalls the reader loop.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                error = "TLS handshake with " + url.host + " failed";
                return false;
            }
        }

        set_socket_timeout(1);
        return true;
    }

    // Read some bytes, waiting at most wait_ms for them to arrive.
    // Returns >0 on data, 0 on EOF, kWouldBlock when nothing arrived, -1 on error.
    ssize_t read_some(char* buf, size_t len, int wait_ms) {
        bool buffered = ssl && SSL_pending(ssl) > 0;
        if (!buffered) {
            struct pollfd p{fd, POLLIN, 0};
            int rc = ::poll(&p, 1, wait_ms);
            if (rc == 0) return kWouldBlock;
            if (rc < 0) return errno == EINTR ? kWouldBlock : -1;
        }

        ssize_t n;
        if (ssl) {
            n = SSL_read(ssl, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl, static_cast<int>(n));
            if (err == SSL_ERROR_ZERO_RETURN) return 0;
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                return kWouldBlock;
            if (err == SSL_ERROR_SYSCALL) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) return kWouldBlock;
                if (n == 0) return 0; // peer closed without close_notify
            }
            return -1;
        }
        n = ::recv(fd, buf, len, 0);
        if (n >= 0) return n;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return kWouldBlock;
        return -1;
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

std::string build_request(const ParsedUrl& url,
                          const std::string& body,
                          const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response head ──────────────────────────────────────────────

enum class Framing { Chunked, Length, UntilClose };

struct ResponseHead {
    long status = 0;
    Framing framing = Framing::UntilClose;
    size_t content_length = 0;
};

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF, error, deadline or abort.
bool read_line(Connection& conn, std::string& leftover, std::string& line,
               SteadyClock::time_point deadline, const std::atomic<bool>* abort) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (aborted(abort) || millis_until(deadline) == 0) return false;
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf), std::min(millis_until(deadline), 200));
        if (n == kWouldBlock) continue;
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

ResponseHead parse_response_head(Connection& conn, std::string& leftover,
                                 SteadyClock::time_point deadline,
                                 const std::atomic<bool>* abort) {
    ResponseHead head;
    std::string status_line;
    if (!read_line(conn, leftover, status_line, deadline, abort)) return head;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return head;
    long status = 0;
    try { status = std::stol(status_line.substr(sp1 + 1, 3)); }
    catch (const std::exception&) { return head; }

    bool has_length = false;
    std::string line;
    while (read_line(conn, leftover, line, deadline, abort)) {
        if (line.empty()) { head.status = status; break; } // end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding" && value.find("chunked") != std::string::npos) {
            head.framing = Framing::Chunked;
        } else if (name == "content-length") {
            try {
                head.content_length = std::stoul(value);
                has_length = true;
            } catch (const std::exception&) {}
        }
    }
    if (head.framing != Framing::Chunked && has_length)
        head.framing = Framing::Length;
    return head;
}

// ── Streaming body ─────────────────────────────────────────────

class SocketByteStream : public ByteStream {
public:
    SocketByteStream(std::unique_ptr<Connection> conn, std::string leftover,
                     const ResponseHead& head)
        : conn_(std::move(conn)), raw_(std::move(leftover)),
          framing_(head.framing), remaining_(head.content_length) {
        if (framing_ == Framing::Length && remaining_ == 0) done_ = true;
    }

    ReadResult read(std::chrono::milliseconds wait) override {
        if (!conn_) return {ReadStatus::Error, "", "stream closed"};

        auto deadline = SteadyClock::now() + wait;
        while (true) {
            std::string out;
            drain(out);
            if (!out.empty()) return {ReadStatus::Data, std::move(out), ""};
            if (done_) return {ReadStatus::EndOfStream, "", ""};

            char buf[4096];
            ssize_t n = conn_->read_some(buf, sizeof(buf), millis_until(deadline));
            if (n == kWouldBlock) {
                if (millis_until(deadline) == 0) return {ReadStatus::Timeout, "", ""};
                continue;
            }
            if (n < 0) return {ReadStatus::Error, "", "connection read failed"};
            if (n == 0) {
                // Server closed; whatever was framed so far is the whole body
                done_ = true;
                continue;
            }
            raw_.append(buf, static_cast<size_t>(n));
        }
    }

    void close() override {
        conn_.reset();
    }

private:
    enum class ChunkState { Size, Data, DataEnd };

    // Move as much decoded body as raw_ allows into out.
    void drain(std::string& out) {
        if (framing_ == Framing::UntilClose) {
            out += raw_;
            raw_.clear();
            return;
        }
        if (framing_ == Framing::Length) {
            size_t take = std::min(remaining_, raw_.size());
            out.append(raw_, 0, take);
            raw_.erase(0, take);
            remaining_ -= take;
            if (remaining_ == 0) done_ = true;
            return;
        }

        while (!done_) {
            if (state_ == ChunkState::Size) {
                size_t pos = raw_.find('\n');
                if (pos == std::string::npos) return;
                std::string size_line = raw_.substr(0, pos);
                raw_.erase(0, pos + 1);
                // Chunk size is hex, may have extensions after ';'
                remaining_ = std::strtoul(size_line.c_str(), nullptr, 16);
                if (remaining_ == 0) {
                    done_ = true; // trailers are ignored
                    return;
                }
                state_ = ChunkState::Data;
            } else if (state_ == ChunkState::Data) {
                if (raw_.empty()) return;
                size_t take = std::min(remaining_, raw_.size());
                out.append(raw_, 0, take);
                raw_.erase(0, take);
                remaining_ -= take;
                if (remaining_ == 0) state_ = ChunkState::DataEnd;
            } else {
                size_t pos = raw_.find('\n');
                if (pos == std::string::npos) return;
                raw_.erase(0, pos + 1);
                state_ = ChunkState::Size;
            }
        }
    }

    std::unique_ptr<Connection> conn_;
    std::string raw_;
    Framing framing_;
    size_t remaining_ = 0;
    ChunkState state_ = ChunkState::Size;
    bool done_ = false;
};

// Collect a (bounded) error body from a non-2xx response.
std::string read_error_body(SocketByteStream& stream, SteadyClock::time_point deadline) {
    std::string body;
    while (body.size() < kMaxErrorBody && millis_until(deadline) > 0) {
        auto r = stream.read(std::chrono::milliseconds(millis_until(deadline)));
        if (r.status != ReadStatus::Data) break;
        body += r.data;
    }
    if (body.size() > kMaxErrorBody) body.resize(kMaxErrorBody);
    return body;
}

} // namespace

// ── Public API ─────────────────────────────────────────────────

OpenResult SocketStreamTransport::open(const StreamRequest& request,
                                       const std::atomic<bool>* abort) {
    OpenResult result;

    ParsedUrl url;
    try {
        url = parse_url(request.url);
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    auto conn = std::make_unique<Connection>();
    if (!conn->connect(url, request.connect_timeout_seconds, abort, result.error))
        return result;

    std::string wire = build_request(url, request.body, request.headers);
    if (!conn->write_all(wire.c_str(), wire.size())) {
        result.error = "failed to send request to " + url.host;
        return result;
    }

    auto deadline = SteadyClock::now() + std::chrono::seconds(request.connect_timeout_seconds);
    std::string leftover;
    ResponseHead head = parse_response_head(*conn, leftover, deadline, abort);
    if (head.status == 0) {
        result.error = aborted(abort) ? "aborted" : "no response from " + url.host;
        return result;
    }

    result.status_code = head.status;
    auto stream = std::make_unique<SocketByteStream>(std::move(conn), std::move(leftover), head);
    if (head.status < 200 || head.status >= 300) {
        result.body = read_error_body(*stream, deadline);
        stream->close();
        return result;
    }
    result.stream = std::move(stream);
    return result;
}

} // namespace kbchat

#endif // __linux__
