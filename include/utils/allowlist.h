// Origin allowlist and URL helpers for artifact sources.
#pragma once

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

namespace modelfetch {

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline std::string trimAscii(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : csv) {
        if (c == ',') {
            auto token = trimAscii(cur);
            if (!token.empty()) out.push_back(token);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    auto token = trimAscii(cur);
    if (!token.empty()) out.push_back(token);
    return out;
}

// '*' matches any run of characters; everything else is literal.
inline bool globMatch(const std::string& pattern, const std::string& value) {
    if (pattern == "*") return true;
    std::string re_text;
    re_text.reserve(pattern.size() * 2 + 2);
    re_text.push_back('^');
    for (char c : pattern) {
        if (c == '*') {
            re_text.append(".*");
        } else if (std::string("\\.+?()[]{}^$|").find(c) != std::string::npos) {
            re_text.push_back('\\');
            re_text.push_back(c);
        } else {
            re_text.push_back(c);
        }
    }
    re_text.push_back('$');
    try {
        return std::regex_match(value, std::regex(re_text, std::regex::icase));
    } catch (const std::regex_error&) {
        return false;
    }
}

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;

    bool valid() const { return !scheme.empty() && !host.empty(); }
    std::string origin() const {
        std::string out = scheme + "://" + host;
        if (port != 0) out += ":" + std::to_string(port);
        return out;
    }
};

inline HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (!std::regex_match(url, match, re)) return parsed;

    int port = 0;
    if (match[3].matched) {
        // At most five digits, so the value always fits before the range check.
        const std::string digits = match[3].str();
        if (digits.size() > 5) return parsed;
        for (char c : digits) port = port * 10 + (c - '0');
        if (port < 1 || port > 65535) return parsed;
    }
    parsed.scheme = toLowerAscii(match[1].str());
    parsed.host = match[2].str();
    parsed.port = port != 0 ? port : (parsed.scheme == "https" ? 443 : 80);
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

// Patterns containing "://" match the full URL, others match the host or
// host+path. An empty allowlist allows nothing.
inline bool isUrlAllowedByAllowlist(const std::string& url, const std::vector<std::string>& allowlist) {
    if (allowlist.empty()) return false;
    auto parsed = parseUrl(url);
    if (!parsed.valid()) return false;

    const std::string host = toLowerAscii(parsed.host);
    const std::string full_url = parsed.scheme + "://" + host + parsed.path;
    const std::string host_path = host + parsed.path;

    for (const auto& raw : allowlist) {
        auto pat = toLowerAscii(trimAscii(raw));
        if (pat.empty()) continue;
        if (pat == "*") return true;
        if (pat.find("://") != std::string::npos) {
            if (globMatch(pat, full_url)) return true;
            continue;
        }
        if (globMatch(pat, host) || globMatch(pat, host_path)) return true;
    }
    return false;
}

}  // namespace modelfetch
