/// @file cookie.cpp
/// @brief Set-Cookie serialisation and Cookie header parsing.

#include "latchkey/http/http_types.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace latchkey::http {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

void appendAttributes(std::string& out, const CookieAttributes& attributes) {
    if (attributes.httpOnly) {
        out += "; HttpOnly";
    }
    if (attributes.secure) {
        out += "; Secure";
    }
    out += "; SameSite=";
    out += sameSiteName(attributes.sameSite);
}

std::string cookiePrefix(std::string_view name, std::string_view value,
                         const CookieAttributes& attributes) {
    std::string out;
    out.reserve(name.size() + value.size() + 96);
    out += name;
    out += '=';
    out += value;
    out += "; Path=";
    out += attributes.path;
    if (attributes.domain) {
        out += "; Domain=";
        out += *attributes.domain;
    }
    return out;
}

} // namespace

std::string serializeSetCookie(std::string_view name, std::string_view value,
                               const CookieAttributes& attributes,
                               std::chrono::seconds maxAge) {
    auto out = cookiePrefix(name, value, attributes);
    out += "; Max-Age=";
    out += std::to_string(maxAge.count());
    appendAttributes(out, attributes);
    return out;
}

std::string serializeClearCookie(std::string_view name, const CookieAttributes& attributes) {
    auto out = cookiePrefix(name, "", attributes);
    out += "; Max-Age=0; Expires=";
    out += formatHttpDate(std::chrono::system_clock::time_point{});
    appendAttributes(out, attributes);
    return out;
}

std::map<std::string, std::string> parseCookieHeader(std::string_view header) {
    std::map<std::string, std::string> cookies;
    std::size_t start = 0;
    while (start <= header.size()) {
        auto end = header.find(';', start);
        if (end == std::string_view::npos) {
            end = header.size();
        }
        auto pair = trim(header.substr(start, end - start));
        auto eq = pair.find('=');
        if (eq != std::string_view::npos && eq > 0) {
            auto name = trim(pair.substr(0, eq));
            auto value = trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            cookies.emplace(std::string(name), std::string(value));
        }
        start = end + 1;
    }
    return cookies;
}

std::string formatHttpDate(std::chrono::system_clock::time_point tp) {
    static constexpr const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                              "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::string normalizeHeaderName(std::string_view name) {
    std::string out(name);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace latchkey::http
