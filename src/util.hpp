#pragma once

#include <string>

namespace query_stream {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/v1/runQuery")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// True if the environment variable @p name is set (to any value).
bool envFlagSet(const char* name);

} // namespace query_stream
