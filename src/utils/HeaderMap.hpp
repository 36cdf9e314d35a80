#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace PageFetch {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

// HTTP field names compare case-insensitively.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

inline std::string HeaderValue(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string();
}

}
