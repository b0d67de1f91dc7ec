#include "native_open_bridge.h"

#include <cctype>
#include <cstdio>

namespace Quire {

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool startsWithNoCase(const std::string& s, const char* prefix) {
    size_t i = 0;
    for (; prefix[i]; ++i) {
        if (i >= s.size()) return false;
        if (std::tolower((unsigned char)s[i]) != std::tolower((unsigned char)prefix[i])) return false;
    }
    return true;
}

std::optional<std::string> normalizeNativePayload(const std::string& raw) {
    size_t begin = 0, end = raw.size();
    while (begin < end && std::isspace((unsigned char)raw[begin])) ++begin;
    while (end > begin && std::isspace((unsigned char)raw[end - 1])) --end;
    std::string s = raw.substr(begin, end - begin);

    if (!startsWithNoCase(s, "file://")) {
        // Plain paths are taken literally; '%' is a legal file name character
        if (s.empty() || s.find('\0') != std::string::npos) return std::nullopt;
        return s;
    }

    s.erase(0, 7);
    // file://localhost/path is the same as file:///path
    if (startsWithNoCase(s, "localhost/")) s.erase(0, 9);

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return std::nullopt;
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            c = (char)(hi * 16 + lo);
            i += 2;
        }
        if (c == '\0') return std::nullopt;
        out.push_back(c);
    }

    // A URL must carry an absolute path
    if (out.empty() || out[0] != '/') return std::nullopt;
    return out;
}

void NativeOpenBridge::deliver(const std::string& raw) {
    auto path = normalizeNativePayload(raw);
    if (!path) {
        fprintf(stderr, "[native-open] discarding malformed payload '%s'\n", raw.c_str());
        return;
    }
    if (m_sink) m_sink(CandidatePath{*path, CandidateSource::NativeBridge});
}

bool NullOpenBridge::start(Sink sink) {
    m_sink = std::move(sink);
    return true;
}

} // namespace Quire
