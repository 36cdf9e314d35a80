#include "CurlEasyContext.hpp"
#include "CurlTransfer.hpp"
#include <stdexcept>
#include "../utils/Logger.hpp"

namespace PageFetch {

CurlEasyContext::CurlEasyContext() {
    Curl::EnsureGlobalInit();
    handle_ = curl_easy_init();
    if (!handle_) {
        throw std::runtime_error("Failed to initialize cURL easy handle");
    }
}

CurlEasyContext::~CurlEasyContext() {
    if (handle_) {
        curl_easy_cleanup(handle_);
    }
}

void CurlEasyContext::Get(const HttpRequest& request, Callback cb) {
    Curl::TransferContext ctx(request, std::move(cb));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        curl_easy_reset(handle_);
        if (!Curl::ConfigureHandle(handle_, &ctx)) {
            ctx.response.error = TransportError::Other;
            ctx.response.error_message = "libcurl rejected a request option";
        } else {
            Logger::Log(LogLevel::Debug, "Performing blocking transfer for URL: " + ctx.full_url);
            CURLcode code = curl_easy_perform(handle_);
            Curl::FinishTransfer(handle_, code, ctx);
        }
    }
    Curl::Deliver(ctx);
}

}
