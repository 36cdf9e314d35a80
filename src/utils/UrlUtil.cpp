#include "UrlUtil.hpp"
#include <algorithm>
#include <cctype>

namespace PageFetch {
namespace UrlUtil {

static inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

// Authority section: everything between "://" and the first of /?#
static inline std::string authority_of(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return {};
    auto start = scheme_end + 3;
    auto end = url.find_first_of("/?#", start);
    if (end == std::string::npos) end = url.size();
    return url.substr(start, end - start);
}

bool IsValidUrl(const std::string& url) {
    if (url.empty()) return false;
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7F) return false;
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;
    std::string scheme = lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return false;

    std::string authority = authority_of(url);
    // Drop userinfo before checking the host itself.
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    return !authority.empty() && authority[0] != ':';
}

std::string UrlEncode(const std::string& s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string AppendQuery(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params) {
    if (params.empty()) return url;

    std::string base = url;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += UrlEncode(key) + "=" + UrlEncode(value);
    }

    auto qmark = base.find('?');
    if (qmark == std::string::npos) {
        base += '?';
    } else if (base.back() != '?' && base.back() != '&') {
        base += '&';
    }
    return base + query + fragment;
}

}
}
