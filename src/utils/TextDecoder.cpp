#include "TextDecoder.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iconv.h>
#include <vector>

namespace PageFetch {
namespace TextDecoder {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

bool IsUtf8Alias(const std::string& charset) {
    return charset.empty() || charset == "utf-8" || charset == "utf8";
}

// Length of the valid UTF-8 sequence starting at i, or 0 if invalid.
size_t ValidSequenceLength(const std::string& s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c < 0x80) return 1;
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c == 0xE0) { len = 3; lo = 0xA0; }
    else if (c >= 0xE1 && c <= 0xEC) len = 3;
    else if (c == 0xED) { len = 3; hi = 0x9F; }
    else if (c >= 0xEE && c <= 0xEF) len = 3;
    else if (c == 0xF0) { len = 4; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) len = 4;
    else if (c == 0xF4) { len = 4; hi = 0x8F; }
    else return 0;

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

std::string SanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = ValidSequenceLength(bytes, i);
        if (len == 0) {
            out += kReplacement;
            ++i;
        } else {
            out.append(bytes, i, len);
            i += len;
        }
    }
    return out;
}

// RAII holder for an iconv descriptor.
class IconvHandle {
public:
    explicit IconvHandle(const std::string& from) : cd_(iconv_open("UTF-8", from.c_str())) {}
    ~IconvHandle() { if (valid()) iconv_close(cd_); }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

}

std::string CharsetFromContentType(const std::string& content_type) {
    std::string lowered(content_type);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c){ return (char)std::tolower(c); });

    auto pos = lowered.find("charset=");
    if (pos == std::string::npos) return {};
    std::string value = lowered.substr(pos + 8);

    auto end = value.find_first_of(";, \t");
    if (end != std::string::npos) value.erase(end);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Decode(const std::string& bytes, const std::string& charset) {
    std::string cs(charset);
    std::transform(cs.begin(), cs.end(), cs.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (IsUtf8Alias(cs) || bytes.empty()) return SanitizeUtf8(bytes);

    IconvHandle handle(cs);
    if (!handle.valid()) return SanitizeUtf8(bytes);

    std::string out;
    std::vector<char> chunk(4096);
    std::vector<char> in(bytes.begin(), bytes.end());
    char* in_ptr = in.data();
    size_t in_left = in.size();

    while (in_left > 0) {
        char* out_ptr = chunk.data();
        size_t out_left = chunk.size();
        size_t rc = iconv(handle.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(chunk.data(), chunk.size() - out_left);
        if (rc != static_cast<size_t>(-1)) continue;

        if (errno == E2BIG) continue;
        // EILSEQ or a truncated trailing sequence: substitute and skip one byte.
        out += kReplacement;
        ++in_ptr;
        --in_left;
        iconv(handle.get(), nullptr, nullptr, nullptr, nullptr);
    }

    // Flush any shift state.
    char* out_ptr = chunk.data();
    size_t out_left = chunk.size();
    iconv(handle.get(), nullptr, nullptr, &out_ptr, &out_left);
    out.append(chunk.data(), chunk.size() - out_left);
    return out;
}

}
}
