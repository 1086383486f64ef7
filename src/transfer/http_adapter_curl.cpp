/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Provides get() over the libcurl easy API: one handle per request, so concurrent callers on
 *   different threads never share curl state.
 * - Honors a total timeout, a capped connect timeout and custom headers.
 * - Cancellation is cooperative: ShouldCancel is polled from the write callback and from the
 *   transfer-progress callback, so an idle request is aborted within one progress tick.
 * - A sink error aborts the transfer and is returned to the caller as-is.
 * - Bodies of responses with status >= 400 are drained without reaching the sink.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <plyfetch/transfer/transfer.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace plyfetch::transfer {

namespace {

// libcurl requires one global init before any handle is created from any thread
void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Write sink context for get()
struct WriteContext {
    CURL* handle{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t received{0};
    bool cancelRequested{false};
    std::optional<Error> sinkError{};
};

bool cancel_requested(WriteContext* ctx) {
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return true;
    }
    return false;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (cancel_requested(ctx))
        return 0; // signal error to curl => CURLE_WRITE_ERROR

    // Error bodies (HTML pages, JSON errors) are counted but never forwarded to the sink
    long status = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status < 400 && ctx->sink && *ctx->sink) {
        std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
        auto r = (*ctx->sink)(bytes);
        if (!r.ok()) {
            ctx->sinkError = r.error();
            return 0;
        }
    }

    ctx->received += static_cast<std::uint64_t>(total);
    return total;
}

// CURL transfer-progress callback; non-zero aborts with CURLE_ABORTED_BY_CALLBACK
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx == nullptr)
        return 0;
    return cancel_requested(ctx) ? 1 : 0;
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, std::chrono::milliseconds timeout) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(static_cast<long>(timeout.count()), 30000)));

    // Worker threads must not receive SIGALRM/SIGPIPE from name resolution
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

// RAII owners for the easy handle and header list
struct CurlEasy {
    CURL* handle{curl_easy_init()};
    ~CurlEasy() {
        if (handle)
            curl_easy_cleanup(handle);
    }
    CurlEasy() = default;
    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;
};

struct CurlHeaders {
    curl_slist* list{nullptr};
    ~CurlHeaders() {
        if (list)
            curl_slist_free_all(list);
    }
    CurlHeaders() = default;
    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;
};

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_global_init(); }
    ~CurlHttpAdapter() override = default;

    Expected<HttpResponse> get(std::string_view url, const std::vector<Header>& headers,
                               std::chrono::milliseconds timeout, const BodySink& sink,
                               const ShouldCancel& shouldCancel) override {
        CurlEasy curl;
        if (!curl.handle) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        CurlHeaders list;
        list.list = build_header_list(headers);

        const std::string urlStr(url);
        curl_easy_setopt(curl.handle, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.handle, CURLOPT_HTTPGET, 1L);
        if (list.list)
            curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, list.list);

        WriteContext wctx;
        wctx.handle = curl.handle;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl.handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.handle, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.handle, CURLOPT_XFERINFODATA, &wctx);

        configure_common(curl.handle, timeout);

        CURLcode rc = curl_easy_perform(curl.handle);

        long http_status = 0;
        curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &http_status);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "GET " + urlStr + " cancelled"};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + urlStr);
        }

        spdlog::debug("GET {} -> HTTP {} ({} bytes)", urlStr, http_status, wctx.received);
        return HttpResponse{http_status, wctx.received};
    }
};

} // namespace

/// Factory: higher layers share one adapter across manifest and chunk requests.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace plyfetch::transfer
