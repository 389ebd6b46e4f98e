#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace query_stream {

namespace {

std::string defaultPort(const std::string& scheme) {
    if (scheme == "http")  return "80";
    if (scheme == "https") return "443";
    throw std::invalid_argument("Unsupported URL scheme: " + scheme);
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    const auto sep = url.find("://");
    if (sep == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }

    UrlParts parts;
    parts.scheme = url.substr(0, sep);
    parts.port   = defaultPort(parts.scheme);

    // Everything up to the first '/' after the scheme is host[:port].
    const std::string rest = url.substr(sep + 3);
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    parts.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    parts.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
        parts.port = authority.substr(colon + 1);
        if (!allDigits(parts.port)) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

bool envFlagSet(const char* name) {
    return std::getenv(name) != nullptr;
}

} // namespace query_stream
