#include "FetchTypes.hpp"

namespace PageFetch {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidUrl:          return "InvalidUrl";
        case ErrorKind::ConnectionFailure:   return "ConnectionFailure";
        case ErrorKind::Timeout:             return "Timeout";
        case ErrorKind::TooManyRedirects:    return "TooManyRedirects";
        case ErrorKind::HttpStatus:          return "HttpStatus";
        case ErrorKind::RateLimited:         return "RateLimited";
        case ErrorKind::ContentTypeMismatch: return "ContentTypeMismatch";
        case ErrorKind::Unexpected:          return "Unexpected";
    }
    return "Unexpected";
}

const HeaderMap& DefaultHeaders() {
    // Some sites sniff these; keep them byte-for-byte.
    static const HeaderMap headers = {
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36"},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"},
        {"Cache-Control", "max-age=0"},
    };
    return headers;
}

FetchConfig FetchConfig::WithRatePreset(RatePreset preset) {
    FetchConfig config;
    config.rate_limiter = RateLimiter::FromPreset(preset);
    return config;
}

}
