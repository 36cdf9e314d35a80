#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "interfaces/IConnectionContext.hpp"

namespace PageFetch {
namespace Testing {

// In-memory connection context. A responder scripts each reply; URLs given a
// delay complete on a background thread, everything else completes inline.
// Delays longer than the request timeout end in TransportError::TimedOut.
class FakeConnectionContext : public IConnectionContext {
public:
    using Responder = std::function<HttpResponse(const HttpRequest&)>;

    explicit FakeConnectionContext(Responder responder) : responder_(std::move(responder)) {}

    ~FakeConnectionContext() override {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    void SetDelay(const std::string& url, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[url] = delay;
    }

    void Get(const HttpRequest& request, Callback cb) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            auto it = delays_.find(request.url);
            if (it != delays_.end()) delay = it->second;
        }

        HttpResponse response = responder_(request);
        if (response.effective_url.empty()) response.effective_url = request.url;
        // A reply slower than the request timeout turns into a timeout at the deadline.
        if (delay > request.timeout) {
            delay = request.timeout;
            response = Failure(TransportError::TimedOut, "Operation timed out after " +
                                                         std::to_string(request.timeout.count()) + " milliseconds");
        }

        if (delay.count() > 0) {
            std::lock_guard<std::mutex> lock(mutex_);
            threads_.emplace_back([cb = std::move(cb), response = std::move(response), delay]() {
                std::this_thread::sleep_for(delay);
                cb(response);
            });
        } else {
            cb(std::move(response));
        }
    }

    size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<HttpRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    static HttpResponse Ok(std::string body, std::string content_type = "text/html; charset=utf-8") {
        HttpResponse r;
        r.status_code = 200;
        r.headers["Content-Type"] = std::move(content_type);
        r.body = std::move(body);
        return r;
    }

    static HttpResponse Status(long status) {
        HttpResponse r;
        r.status_code = status;
        r.headers["Content-Type"] = "text/html";
        r.body = "error " + std::to_string(status);
        return r;
    }

    static HttpResponse Failure(TransportError error, std::string message) {
        HttpResponse r;
        r.error = error;
        r.error_message = std::move(message);
        return r;
    }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::vector<HttpRequest> requests_;
    std::vector<std::thread> threads_;
};

}
}
