/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Single-stream GET using the libcurl easy API, one easy handle per fetch.
 * - Honors overall/connect/stall timeouts, TLS verify/CA, proxy, headers and redirects.
 * - Cooperative cancellation is checked in the write callback (per received chunk) and in
 *   the transfer-info callback, which libcurl also calls while the connection is idle.
 * - Classifies libcurl failures into downloader ErrorCodes; HTTP >= 400 is reported as
 *   ErrorCode::HttpStatus carrying the status.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <mediadl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace mediadl::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where, long httpStatus) {
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
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkUnreachable;
            break;
        case CURLE_PARTIAL_FILE:
            // Body shorter than the announced Content-Length
            err.code = ErrorCode::IntegrityMismatch;
            break;
        case CURLE_HTTP_RETURNED_ERROR:
            err.code = ErrorCode::HttpStatus;
            err.httpStatus = static_cast<int>(httpStatus);
            err.message = "HTTP error " + std::to_string(httpStatus);
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::StorageWriteFailure;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::Cancelled;
            break;
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_FILE_COULDNT_READ_FILE:
            err.code = ErrorCode::NotFound;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context
struct HeaderParseContext {
    CURL* curl{nullptr};
    FetchInfo info{};
    const std::function<void(const FetchInfo&)>* onResponse{nullptr};
};

// CURL header callback. Called once per header line; a blank line ends a header block
// (there is one block per redirect hop, the last one describes the body).
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        ctx->info.httpStatus = status;
        const bool redirect = status >= 300 && status < 400;
        if (!redirect && ctx->onResponse && *ctx->onResponse) {
            (*ctx->onResponse)(ctx->info);
        }
        return total;
    }

    if (line.rfind("HTTP/", 0) == 0) {
        // New response (e.g. after a redirect): forget the previous hop's metadata
        ctx->info = FetchInfo{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        const char* first = val.data();
        const char* last = val.data() + val.size();
        auto res = std::from_chars(first, last, tmp);
        if (res.ec == std::errc()) {
            ctx->info.contentLength = tmp;
        }
    } else if (key == "content-type") {
        ctx->info.contentType = val;
    }

    return total;
}

// Write sink context for fetch
struct WriteContext {
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t downloaded{0};
    bool cancelRequested{false};
    std::optional<Error> sinkError;
};

static bool cancel_requested(WriteContext* ctx) {
    if (ctx->cancelRequested)
        return true;
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
    }
    return ctx->cancelRequested;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (cancel_requested(ctx)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Expected<void>{Error{ErrorCode::StorageWriteFailure, "No sink provided"}};
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }

    ctx->downloaded += static_cast<std::uint64_t>(total);
    return total;
}

// CURL transfer-info callback: non-zero return aborts with CURLE_ABORTED_BY_CALLBACK
static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    if (userdata == nullptr)
        return 0;
    return cancel_requested(static_cast<WriteContext*>(userdata)) ? 1 : 0;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
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
static void configure_common(CURL* curl, const FetchRequest& request) {
    // Timeouts (0 = libcurl default / no limit)
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connectTimeout.count()));
    if (request.stallTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(request.stallTimeout.count()));
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.tls.insecure ? 0L : 2L);
    if (!request.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.tls.caPath.c_str());
    }

    // Proxy
    if (request.proxy && !request.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
    }

    if (!request.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag once;
        std::call_once(once, [] {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
                spdlog::error("curl_global_init failed");
            }
        });
    }
    ~CurlHttpAdapter() override = default;

    Expected<FetchInfo> fetch(const FetchRequest& request, const ByteSink& sink,
                              const ShouldCancel& shouldCancel,
                              const std::function<void(const FetchInfo&)>& onResponse) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(request.headers);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        if (list)
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        WriteContext wctx;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);

        HeaderParseContext hctx{};
        hctx.curl = curl;
        hctx.onResponse = &onResponse;
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        configure_common(curl, request);

        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        // Protocols without header blocks (file://) still report their size here
        if (!hctx.info.contentLength) {
            curl_off_t cl = -1;
            if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK &&
                cl >= 0) {
                hctx.info.contentLength = static_cast<std::uint64_t>(cl);
            }
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "Transfer cancelled by user"};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "fetch(GET)", http_status);
            spdlog::debug("curl fetch of {} failed: {}", request.url, err.message);
            return err;
        }

        FetchInfo info = hctx.info;
        info.httpStatus = http_status;
        spdlog::debug("curl fetch of {} done: status={} bytes={}", request.url, http_status,
                      wctx.downloaded);
        return info;
    }
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace mediadl::downloader
