#pragma once
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <memory>
#include <string>
#include "../interfaces/IConnectionContext.hpp"

namespace PageFetch {
namespace Curl {

// curl_global_init exactly once per process.
void EnsureGlobalInit();

// State for a single easy-handle transfer. Owns the request header list.
struct TransferContext {
    HttpRequest request;
    IConnectionContext::Callback callback;
    HttpResponse response;
    std::string full_url;
    std::string cookie_header;
    curl_slist* header_list = nullptr;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    TransferContext(HttpRequest req, IConnectionContext::Callback cb);
    ~TransferContext();
    TransferContext(const TransferContext&) = delete;
    TransferContext& operator=(const TransferContext&) = delete;
};

// Applies every request option to `curl` and points its callbacks at `ctx`.
// Returns false if libcurl rejected an option.
bool ConfigureHandle(CURL* curl, TransferContext* ctx);

// Fills status, effective URL and transport error after a transfer finished.
void FinishTransfer(CURL* curl, CURLcode code, TransferContext& ctx);

TransportError Classify(CURLcode code);

// Folds one raw header line into `headers`. A status line starts a new set.
// Repeated fields are joined with ", ", except Set-Cookie, which keeps the last value.
void AddHeaderLine(HeaderMap& headers, const std::string& line);

// Runs the callback, logging anything it throws.
void Deliver(TransferContext& ctx);

}
}
