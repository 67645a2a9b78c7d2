#include <edge_agent/core/text.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace edge_agent {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\f' || c == '\v';
}

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

std::string_view Trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && IsSpace(s[begin])) {
        ++begin;
    }
    return TrimRight(s.substr(begin));
}

std::string_view TrimRight(std::string_view s) {
    size_t end = s.size();
    while (end > 0 && IsSpace(s[end - 1])) {
        --end;
    }
    return s.substr(0, end);
}

std::string ToLowerAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

bool IsValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if (!IsContinuationByte(cc)) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong encodings, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::size_t Utf8FloorBoundary(std::string_view s, std::size_t max_bytes) {
    if (max_bytes >= s.size()) {
        return s.size();
    }
    size_t n = max_bytes;
    while (n > 0 && IsContinuationByte(static_cast<unsigned char>(s[n]))) {
        --n;
    }
    return n;
}

std::size_t Utf8CeilBoundary(std::string_view s, std::size_t min_pos) {
    size_t n = min_pos;
    while (n < s.size() && IsContinuationByte(static_cast<unsigned char>(s[n]))) {
        ++n;
    }
    return std::min(n, s.size());
}

} // namespace edge_agent
