#pragma once
#include <string>
#include <utility>
#include <vector>

namespace PageFetch {
namespace UrlUtil {

// True for http:// or https:// URLs (scheme case-insensitive) with a non-empty
// host part and no whitespace or control characters. Pure, no I/O.
bool IsValidUrl(const std::string& url);

// Percent-encode everything except RFC 3986 unreserved characters.
std::string UrlEncode(const std::string& s);

// Appends encoded key=value pairs to the query string, keeping any fragment last.
std::string AppendQuery(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params);

}
}
