// @include/tabvault/url_utils.h
#pragma once

#include <optional>
#include <string>

namespace tabvault {
namespace url_utils {

struct ParsedUrl {
    std::string scheme;     // lower-cased, without ':'
    bool has_authority = false;
    std::string host;       // lower-cased hostname without userinfo or port
    std::string authority;  // raw authority as written (userinfo@host:port)
    std::string rest;       // path, query and fragment
};

std::optional<ParsedUrl> parseUrl(const std::string& url);

bool isValidUrl(const std::string& url);

// Hostname of the URL, or nullopt when it cannot be parsed or has no host
std::optional<std::string> extractDomain(const std::string& url);

/**
 * @brief Shortens URLs longer than max_length.
 * Keeps scheme://host plus the first keep_path characters of the remainder followed by "...";
 * an unparsable URL keeps its first max_length characters followed by "...".
 */
std::string truncateUrl(const std::string& url, size_t max_length = 500, size_t keep_path = 200);

// Truncates to max_length characters and appends "..." when longer
std::string truncateText(const std::string& text, size_t max_length);

std::string toLower(const std::string& text);

} // namespace url_utils
} // namespace tabvault
