#include "CurlTransfer.hpp"
#include <mutex>
#include <new>
#include <stdexcept>
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace PageFetch {
namespace Curl {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;
    try {
        ctx->response.body.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    return chunk;
}

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return 0;

    AddHeaderLine(ctx->response.headers, std::string(buffer, total));
    return total;
}

std::string CookieHeader(const CookieMap& cookies) {
    std::string out;
    for (const auto& [name, value] : cookies) {
        if (!out.empty()) out += "; ";
        out += name + "=" + value;
    }
    return out;
}

}

void AddHeaderLine(HeaderMap& headers, const std::string& line) {
    // Each response in a redirect chain starts with a status line; keep only the last set.
    if (line.rfind("HTTP/", 0) == 0) {
        headers.clear();
        return;
    }

    auto pos = line.find(':');
    if (pos == std::string::npos) return;
    std::string key = Trim(line.substr(0, pos));
    std::string value = Trim(line.substr(pos + 1));
    if (key.empty()) return;

    const HeaderMap::key_compare less{};
    const bool is_set_cookie = !less(key, "Set-Cookie") && !less("Set-Cookie", key);

    auto it = headers.find(key);
    if (it == headers.end()) {
        headers.emplace(std::move(key), std::move(value));
    } else if (is_set_cookie) {
        // Cookie attributes may contain commas, so Set-Cookie values are never joined.
        it->second = std::move(value);
    } else {
        it->second += ", " + value;
    }
}

void EnsureGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

TransferContext::TransferContext(HttpRequest req, IConnectionContext::Callback cb)
    : request(std::move(req)), callback(std::move(cb)) {
    full_url = UrlUtil::AppendQuery(request.url, request.query);
    cookie_header = CookieHeader(request.cookies);
    for (const auto& [k, v] : request.headers) {
        std::string line = k + ": " + v;
        header_list = curl_slist_append(header_list, line.c_str());
    }
}

TransferContext::~TransferContext() {
    if (header_list) curl_slist_free_all(header_list);
}

bool ConfigureHandle(CURL* curl, TransferContext* ctx) {
    const auto& req = ctx->request;
    bool ok = true;
    auto set = [&ok](CURLcode rc) { if (rc != CURLE_OK) ok = false; };

    set(curl_easy_setopt(curl, CURLOPT_URL, ctx->full_url.c_str()));
    set(curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L));
    set(curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback));
    set(curl_easy_setopt(curl, CURLOPT_WRITEDATA, ctx));
    set(curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback));
    set(curl_easy_setopt(curl, CURLOPT_HEADERDATA, ctx));
    set(curl_easy_setopt(curl, CURLOPT_HTTPHEADER, ctx->header_list));
    set(curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L));
    set(curl_easy_setopt(curl, CURLOPT_MAXREDIRS, req.max_redirects));
    set(curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count())));
    set(curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L));
    set(curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""));
    set(curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, req.verify_tls ? 1L : 0L));
    set(curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, req.verify_tls ? 2L : 0L));
    set(curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, ctx->error_buffer));
    set(curl_easy_setopt(curl, CURLOPT_PRIVATE, ctx));

    if (!ctx->cookie_header.empty()) {
        set(curl_easy_setopt(curl, CURLOPT_COOKIE, ctx->cookie_header.c_str()));
    }
    if (req.proxy && !req.proxy->empty()) {
        set(curl_easy_setopt(curl, CURLOPT_PROXY, req.proxy->c_str()));
    }

    set(curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https"));
    set(curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https"));
    return ok;
}

TransportError Classify(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportError::None;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::TimedOut;
        case CURLE_TOO_MANY_REDIRECTS:
            return TransportError::TooManyRedirects;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return TransportError::ConnectionFailed;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportError::Aborted;
        default:
            return TransportError::Other;
    }
}

void FinishTransfer(CURL* curl, CURLcode code, TransferContext& ctx) {
    ctx.response.error = Classify(code);
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &ctx.response.status_code);
    } else {
        ctx.response.error_message = ctx.error_buffer[0] ? ctx.error_buffer : curl_easy_strerror(code);
    }
    char* eff_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url);
    ctx.response.effective_url = eff_url ? eff_url : ctx.full_url;
}

void Deliver(TransferContext& ctx) {
    if (!ctx.callback) return;
    try {
        ctx.callback(std::move(ctx.response));
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Exception in transfer callback for " + ctx.request.url + ": " + std::string(e.what()));
    } catch (...) {
        Logger::Log(LogLevel::Error, "Unknown exception in transfer callback for " + ctx.request.url);
    }
}

}
}
