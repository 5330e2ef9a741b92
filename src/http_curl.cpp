// libcurl streaming transport for non-Linux platforms. Uses the multi
// interface so the response body can be pulled with a bounded wait.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace kbchat {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr size_t kMaxErrorBody = 64 * 1024;

bool aborted(const std::atomic<bool>* abort) {
    return abort && abort->load(std::memory_order_relaxed);
}

int millis_until(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII multi transfer ───────────────────────────────────────

struct CurlTransfer {
    CURLM* multi = curl_multi_init();
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;
    std::string body;       // request body; must outlive the transfer
    std::string buffer;     // received, not yet returned
    bool finished = false;
    CURLcode result = CURLE_OK;

    CurlTransfer() = default;
    ~CurlTransfer() {
        if (multi && curl) curl_multi_remove_handle(multi, curl);
        if (curl) curl_easy_cleanup(curl);
        if (multi) curl_multi_cleanup(multi);
        curl_slist_free_all(hlist);
    }
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    explicit operator bool() const { return multi != nullptr && curl != nullptr; }

    // Drive the transfer for at most wait_ms. Returns false on a multi error.
    bool pump(int wait_ms) {
        int running = 0;
        if (curl_multi_perform(multi, &running) != CURLM_OK) return false;
        if (running > 0 && buffer.empty()) {
            curl_multi_poll(multi, nullptr, 0, wait_ms, nullptr);
            if (curl_multi_perform(multi, &running) != CURLM_OK) return false;
        }
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                finished = true;
                result = msg->data.result;
            }
        }
        return true;
    }

    long response_code() const {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }
};

class CurlByteStream : public ByteStream {
public:
    explicit CurlByteStream(std::unique_ptr<CurlTransfer> transfer)
        : transfer_(std::move(transfer)) {}

    ReadResult read(std::chrono::milliseconds wait) override {
        if (!transfer_) return {ReadStatus::Error, "", "stream closed"};

        auto deadline = SteadyClock::now() + wait;
        while (true) {
            if (!transfer_->buffer.empty()) {
                std::string out;
                out.swap(transfer_->buffer);
                return {ReadStatus::Data, std::move(out), ""};
            }
            if (transfer_->finished) {
                if (transfer_->result != CURLE_OK)
                    return {ReadStatus::Error, "", curl_easy_strerror(transfer_->result)};
                return {ReadStatus::EndOfStream, "", ""};
            }
            if (!transfer_->pump(millis_until(deadline)))
                return {ReadStatus::Error, "", "curl multi error"};
            if (transfer_->buffer.empty() && !transfer_->finished &&
                millis_until(deadline) == 0)
                return {ReadStatus::Timeout, "", ""};
        }
    }

    void close() override {
        transfer_.reset();
    }

private:
    std::unique_ptr<CurlTransfer> transfer_;
};

} // namespace

// ── Public API ────────────────────────────────────────────────

OpenResult CurlStreamTransport::open(const StreamRequest& request,
                                     const std::atomic<bool>* abort) {
    OpenResult result;
    auto transfer = std::make_unique<CurlTransfer>();
    if (!*transfer) {
        result.error = "curl initialisation failed";
        return result;
    }

    transfer->body = request.body;
    transfer->hlist = build_headers(request.headers);
    CURL* curl = transfer->curl;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer->hlist);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, transfer->body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(transfer->body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer->buffer);
    curl_multi_add_handle(transfer->multi, curl);

    // Pump until the response head is in (status code known) or the transfer ends
    auto deadline = SteadyClock::now() + std::chrono::seconds(request.connect_timeout_seconds);
    while (transfer->response_code() == 0 && !transfer->finished) {
        if (aborted(abort)) {
            result.error = "aborted";
            return result;
        }
        if (millis_until(deadline) == 0) {
            result.error = "no response from " + request.url;
            return result;
        }
        if (!transfer->pump(200)) {
            result.error = "curl multi error";
            return result;
        }
    }

    result.status_code = transfer->response_code();
    if (result.status_code == 0) {
        result.error = curl_easy_strerror(transfer->result);
        return result;
    }

    if (result.status_code < 200 || result.status_code >= 300) {
        while (!transfer->finished && transfer->buffer.size() < kMaxErrorBody &&
               millis_until(deadline) > 0) {
            if (!transfer->pump(200)) break;
        }
        result.body = transfer->buffer.substr(0, kMaxErrorBody);
        return result;
    }

    result.stream = std::make_unique<CurlByteStream>(std::move(transfer));
    return result;
}

} // namespace kbchat

#endif // !__linux__
