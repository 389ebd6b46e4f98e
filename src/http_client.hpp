#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace query_stream {

/// Low-level JSON-over-HTTP client built on Boost.Beast.
/// Sends a JSON-encoded POST and returns the parsed response body.
///
/// Each call opens its own connection, so one instance can be shared by
/// several worker threads.
class HttpJsonClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        nlohmann::json body;
    };

    /// @param endpoint     Full URL, e.g. "http://localhost:4000/v1/runQuery"
    /// @param accessToken  Optional bearer token (sent as Authorization)
    /// @param timeoutMs    Per-operation timeout in milliseconds
    HttpJsonClient(const std::string& endpoint,
                   const std::string& accessToken = "",
                   int timeoutMs = 5000);

    /// POST @p payload to the endpoint.
    /// @throws TimeoutError when the deadline expires.
    /// @throws BackendError on other network errors or an unparseable body.
    Response post(const nlohmann::json& payload) const;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mTarget;
    std::string mAccessToken;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& requestBody) const;
    Response doHttpsRequest(const std::string& requestBody) const;
};

} // namespace query_stream
