#include "ProfileUtil.hpp"
#include <ctime>
#include <cstdio>

namespace BioVerify {
namespace ProfileUtil {

static inline std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Percent-encode everything except RFC 3986 unreserved characters
static inline std::string EncodePathSegment(const std::string& s) {
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

std::string NormalizeUsername(const std::string& raw) {
    std::string s = raw;
    auto at = s.find('@');
    if (at != std::string::npos) s.erase(at, 1);
    return Trim(s);
}

std::optional<ProfileRequest> MakeRequest(const std::string& raw_username, const std::string& code) {
    ProfileRequest request{NormalizeUsername(raw_username), code};
    if (request.username.empty() || request.code.empty()) return std::nullopt;
    return request;
}

std::string BuildProfileUrl(const std::string& base_url, const std::string& username) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/@" + EncodePathSegment(username);
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs).count();
    if (millis < 0) {
        secs -= std::chrono::seconds(1);
        millis += 1000;
    }
    std::time_t t = static_cast<std::time_t>(secs.count());

    std::tm buf;
    #ifdef _WIN32
    gmtime_s(&buf, &t);
    #else
    gmtime_r(&t, &buf);
    #endif

    char out[32];
    std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday,
                  buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<int>(millis));
    return out;
}

}
}
