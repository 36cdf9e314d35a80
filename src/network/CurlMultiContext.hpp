#pragma once
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>
#include <memory>
#include "../interfaces/IConnectionContext.hpp"

// Forward declare CURLM / CURL
typedef void CURLM;
typedef void CURL;

namespace PageFetch {

namespace Curl { struct TransferContext; }

// Pooled connection context: one worker thread drives a curl multi handle, so
// concurrent requests share connections, DNS and TLS sessions. Callbacks run
// on the worker thread.
class CurlMultiContext : public IConnectionContext {
public:
    // max_connections == 0 leaves libcurl's default (unlimited).
    explicit CurlMultiContext(long max_connections = 0);
    // Transfers still in flight complete with TransportError::Aborted.
    ~CurlMultiContext() override;

    // Non-copyable
    CurlMultiContext(const CurlMultiContext&) = delete;
    CurlMultiContext& operator=(const CurlMultiContext&) = delete;

    void Get(const HttpRequest& request, Callback cb) override;

private:
    void Run();
    void StartPending();
    void DrainCompleted();
    void AbortAll();

    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    bool stop_ = false;
    std::vector<std::unique_ptr<Curl::TransferContext>> pending_requests_;
    std::unordered_set<CURL*> active_;   // worker thread only
};

}
