#include "CurlMultiContext.hpp"
#include "CurlTransfer.hpp"
#include <stdexcept>
#include <string>
#include "../utils/Logger.hpp"

namespace PageFetch {

CurlMultiContext::CurlMultiContext(long max_connections) {
    Curl::EnsureGlobalInit();
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    curl_multi_setopt(multi_handle_, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
    if (max_connections > 0) {
        curl_multi_setopt(multi_handle_, CURLMOPT_MAX_TOTAL_CONNECTIONS, max_connections);
    }
    worker_thread_ = std::thread(&CurlMultiContext::Run, this);
}

CurlMultiContext::~CurlMultiContext() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void CurlMultiContext::Get(const HttpRequest& request, Callback cb) {
    auto ctx = std::make_unique<Curl::TransferContext>(request, std::move(cb));
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Connection context is shutting down");
        }
        pending_requests_.push_back(std::move(ctx));
    }
    curl_multi_wakeup(multi_handle_);
}

void CurlMultiContext::StartPending() {
    std::vector<std::unique_ptr<Curl::TransferContext>> current_requests;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(current_requests, pending_requests_);
    }

    for (auto& req : current_requests) {
        CURL* easy_handle = curl_easy_init();
        if (!easy_handle || !Curl::ConfigureHandle(easy_handle, req.get())) {
            if (easy_handle) curl_easy_cleanup(easy_handle);
            Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + req->request.url);
            req->response.error = TransportError::Other;
            req->response.error_message = "Failed to create cURL easy handle";
            Curl::Deliver(*req);
            continue;
        }
        if (curl_multi_add_handle(multi_handle_, easy_handle) != CURLM_OK) {
            curl_easy_cleanup(easy_handle);
            req->response.error = TransportError::Other;
            req->response.error_message = "Failed to add transfer to cURL multi handle";
            Curl::Deliver(*req);
            continue;
        }
        active_.insert(easy_handle);
        Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + req->full_url);
        req.release(); // now owned through CURLOPT_PRIVATE
    }
}

void CurlMultiContext::DrainCompleted() {
    int msgs_in_queue = 0;
    CURLMsg* msg = nullptr;
    while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
        if (msg->msg != CURLMSG_DONE) continue;

        CURL* easy_handle = msg->easy_handle;
        CURLcode code = msg->data.result;
        Curl::TransferContext* raw = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &raw);
        std::unique_ptr<Curl::TransferContext> transfer_ctx(raw);

        Curl::FinishTransfer(easy_handle, code, *transfer_ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        active_.erase(easy_handle);

        Curl::Deliver(*transfer_ctx);
    }
}

void CurlMultiContext::AbortAll() {
    for (CURL* easy_handle : active_) {
        Curl::TransferContext* raw = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &raw);
        std::unique_ptr<Curl::TransferContext> transfer_ctx(raw);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        if (!transfer_ctx) continue;
        transfer_ctx->response.error = TransportError::Aborted;
        transfer_ctx->response.error_message = "Connection context closed before the transfer completed";
        Curl::Deliver(*transfer_ctx);
    }
    active_.clear();

    std::vector<std::unique_ptr<Curl::TransferContext>> never_started;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(never_started, pending_requests_);
    }
    for (auto& req : never_started) {
        req->response.error = TransportError::Aborted;
        req->response.error_message = "Connection context closed before the transfer started";
        Curl::Deliver(*req);
    }
}

void CurlMultiContext::Run() {
    Logger::Log(LogLevel::Debug, "CurlMultiContext worker thread started.");
    int still_running = 0;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) break;
        }

        StartPending();
        curl_multi_perform(multi_handle_, &still_running);
        DrainCompleted();

        // Sleeps until socket activity, a transfer timeout, or curl_multi_wakeup().
        curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
    }

    if (!active_.empty()) {
        Logger::Log(LogLevel::Warn, "Aborting " + std::to_string(active_.size()) + " in-flight transfer(s) on shutdown.");
    }
    AbortAll();
    Logger::Log(LogLevel::Debug, "CurlMultiContext worker thread stopped.");
}

}
