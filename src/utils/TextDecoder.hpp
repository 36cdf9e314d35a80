#pragma once
#include <string>

namespace PageFetch {
namespace TextDecoder {

// Lowercased charset parameter of a Content-Type value, or "" when absent.
std::string CharsetFromContentType(const std::string& content_type);

// Decodes raw body bytes to UTF-8. An empty charset means UTF-8; unknown
// charsets fall back to UTF-8. Undecodable bytes become U+FFFD.
std::string Decode(const std::string& bytes, const std::string& charset);

}
}
