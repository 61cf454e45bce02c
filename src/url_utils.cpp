#include "tabvault/url_utils.h"

#include <algorithm>
#include <cctype>

namespace tabvault {
namespace url_utils {

namespace {

bool isSchemeChar(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '.' || c == '-';
}

bool requiresHost(const std::string& scheme) {
    return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss" || scheme == "ftp";
}

} // namespace

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    if (url.empty() || std::any_of(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c); })) {
        return std::nullopt;
    }
    // scheme ":" ["//" authority] rest
    size_t colon_pos = url.find(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || !std::isalpha(static_cast<unsigned char>(url[0])) ||
        !std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(colon_pos),
                     [](unsigned char c) { return isSchemeChar(c); })) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, colon_pos));
    size_t pos = colon_pos + 1;
    if (url.compare(pos, 2, "//") == 0) {
        parsed.has_authority = true;
        pos += 2;
        size_t end = url.find_first_of("/?#", pos);
        if (end == std::string::npos) end = url.size();
        parsed.authority = url.substr(pos, end - pos);
        pos = end;
    }
    parsed.rest = url.substr(pos);

    std::string host = parsed.authority;
    size_t at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    if (!host.empty() && host.front() == '[') {
        size_t close = host.find(']');
        if (close == std::string::npos) return std::nullopt;
        host = host.substr(0, close + 1);
    } else {
        size_t colon = host.find(':');
        if (colon != std::string::npos) {
            std::string port = host.substr(colon + 1);
            if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            host = host.substr(0, colon);
        }
    }
    parsed.host = toLower(host);

    if (requiresHost(parsed.scheme) && (!parsed.has_authority || parsed.host.empty())) {
        return std::nullopt;
    }
    return parsed;
}

bool isValidUrl(const std::string& url) {
    return parseUrl(url).has_value();
}

std::optional<std::string> extractDomain(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed || parsed->host.empty()) {
        return std::nullopt;
    }
    return parsed->host;
}

std::string truncateUrl(const std::string& url, size_t max_length, size_t keep_path) {
    if (url.size() <= max_length) {
        return url;
    }
    auto parsed = parseUrl(url);
    if (!parsed || !parsed->has_authority) {
        return url.substr(0, max_length) + "...";
    }
    std::string prefix = parsed->scheme + "://" + parsed->authority;
    return prefix + parsed->rest.substr(0, keep_path) + "...";
}

std::string truncateText(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length) + "...";
}

} // namespace url_utils
} // namespace tabvault
