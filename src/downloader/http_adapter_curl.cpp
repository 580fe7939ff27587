/*
 * segdl/src/downloader/http_adapter_curl.cpp
 *
 * Notes
 * - Provides probe() and fetch() implementations using libcurl easy API.
 * - Honors timeouts, TLS verify/CA, proxy, headers, redirects, user agent and Range.
 * - Delivers the final response head before the first body byte so callers can
 *   reject a response (wrong status, ignored Range) without writing anything.
 * - Cooperative cancellation is checked per buffer and from the transfer-info
 *   callback, so a stalled connection still notices a pause.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <segdl/downloader/downloader.hpp>
#include <segdl/downloader/http_headers.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace segdl::downloader {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
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
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context. A new status line starts a fresh head so that only
// the last response of a redirect chain is reported.
struct HeaderParseContext {
    ResponseHead head{};
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        ctx->head = ResponseHead{};
        auto sp = line.find(' ');
        if (sp != std::string_view::npos && sp + 4 <= line.size()) {
            ctx->head.status = std::atoi(std::string(line.substr(sp + 1, 3)).c_str());
        }
        return total;
    }

    (void)applyHeaderLine(ctx->head, line);
    return total;
}

// Stops the fallback probe at the first body byte; the head is all it needs
size_t stop_body_cb(char*, size_t, size_t, void*) {
    return 0;
}

// Write sink context for fetch()
struct WriteContext {
    CURL* curl{nullptr};
    HeaderParseContext* headers{nullptr};
    const HeadHandler* onHead{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool headDelivered{false};
    std::optional<Error> abortError{};
};

Expected<void> deliverHead(WriteContext& ctx) {
    ctx.headDelivered = true;
    long http_status = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_status);
    ctx.headers->head.status = static_cast<int>(http_status);
    if (ctx.onHead && *ctx.onHead) {
        return (*ctx.onHead)(ctx.headers->head);
    }
    return Expected<void>{};
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->abortError = Error{ErrorCode::PauseInterrupt, "Transfer interrupted by pause"};
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (!ctx->headDelivered) {
        Expected<void> hr;
        try {
            hr = deliverHead(*ctx);
        } catch (const std::exception& ex) {
            hr = Error{ErrorCode::Unknown, std::string("Exception in head handler: ") + ex.what()};
        }
        if (!hr.ok()) {
            ctx->abortError = hr.error();
            return 0;
        }
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    Expected<void> r;
    try {
        r = (ctx->sink && *ctx->sink)
                ? (*ctx->sink)(bytes)
                : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
    } catch (const std::exception& ex) {
        // Never let an exception unwind through libcurl
        r = Error{ErrorCode::Unknown, std::string("Exception in body sink: ") + ex.what()};
    }
    if (!r.ok()) {
        // Abort transfer
        ctx->abortError = r.error();
        return 0;
    }
    return total;
}

// Lets a pause interrupt a connection that is waiting for data
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        if (!ctx->abortError) {
            ctx->abortError = Error{ErrorCode::PauseInterrupt, "Transfer interrupted by pause"};
        }
        return 1;
    }
    return 0;
}

// Helper to build curl_slist from headers
HeaderList build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList{list, &curl_slist_free_all};
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const HttpOptions& options) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(
        curl, CURLOPT_CONNECTTIMEOUT_MS,
        static_cast<long>(std::min(options.timeout.count(), options.connectTimeout.count())));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureCurlInitialized(); }
    ~CurlHttpAdapter() override = default;

    Expected<ResponseHead> probe(std::string_view url, const std::vector<Header>& headers,
                                 const HttpOptions& options) override {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        auto list = build_header_list(headers);
        HeaderParseContext hctx{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());

        configure_common(curl.get(), options);

        CURLcode rc = curl_easy_perform(curl.get());
        long http_status = 0;
        if (rc == CURLE_OK) {
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
            if (http_status != 405 && http_status != 501) {
                hctx.head.status = static_cast<int>(http_status);
                return hctx.head;
            }
        }

        // Some servers reject HEAD; try GET range 0-0 as fallback
        spdlog::debug("HEAD probe failed ({}), attempting GET Range 0-0",
                      rc == CURLE_OK ? "HTTP " + std::to_string(http_status)
                                     : std::string(curl_easy_strerror(rc)));
        hctx.head = ResponseHead{};
        auto rangeList = build_header_list(headers);
        curl_slist* appended = curl_slist_append(rangeList.get(), "Range: bytes=0-0");
        if (appended != nullptr) {
            (void)rangeList.release();
            rangeList.reset(appended);
        }
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, rangeList.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stop_body_cb);

        rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK && rc != CURLE_WRITE_ERROR) {
            return makeCurlError(rc, "probe(GET range)");
        }

        http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
        hctx.head.status = static_cast<int>(http_status);
        // If 206, Range works; if 200, server ignored Range.
        if (http_status == 206) {
            hctx.head.acceptRangesBytes = true;
        }
        return hctx.head;
    }

    Expected<ResponseHead> fetch(std::string_view url, const std::optional<ByteRange>& range,
                                 const std::vector<Header>& headers, const HttpOptions& options,
                                 const HeadHandler& onHead, const BodySink& sink,
                                 const ShouldCancel& shouldCancel) override {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        auto list = build_header_list(headers);
        std::string rangeValue;
        if (range) {
            rangeValue = formatRangeHeader(*range);
            // CURLOPT_RANGE takes the value without the "bytes=" unit
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, rangeValue.c_str() + 6);
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());

        HeaderParseContext hctx{};
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl.get();
        wctx.headers = &hctx;
        wctx.onHead = &onHead;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &wctx);
        if (options.bufferSize > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(options.bufferSize));
        }

        configure_common(curl.get(), options);

        CURLcode rc = curl_easy_perform(curl.get());

        if (wctx.abortError) {
            return *wctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET)");
        }
        if (!wctx.headDelivered) {
            // Empty body: the head still has to be judged by the caller
            auto hr = deliverHead(wctx);
            if (!hr.ok()) {
                return hr.error();
            }
        }
        return hctx.head;
    }
};

} // namespace

/// Factory: provide a way for higher layers to create a CURL adapter.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace segdl::downloader
