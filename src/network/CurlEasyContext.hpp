#pragma once
#include <mutex>
#include "../interfaces/IConnectionContext.hpp"

typedef void CURL;

namespace PageFetch {

// Blocking connection context. Get() performs the transfer on the calling
// thread and invokes the callback before returning. One easy handle is reused,
// so consecutive requests keep libcurl's connection cache; calls are serialized.
class CurlEasyContext : public IConnectionContext {
public:
    CurlEasyContext();
    ~CurlEasyContext() override;

    CurlEasyContext(const CurlEasyContext&) = delete;
    CurlEasyContext& operator=(const CurlEasyContext&) = delete;

    void Get(const HttpRequest& request, Callback cb) override;

private:
    CURL* handle_ = nullptr;
    std::mutex mutex_;
};

}
