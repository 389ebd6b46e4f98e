#include "http_client.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef QUERY_STREAM_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace query_stream {

namespace {

http::request<http::string_body> makeRequest(const std::string& host,
                                             const std::string& target,
                                             const std::string& accessToken,
                                             const std::string& body) {
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "query_stream/1.0");
    if (!accessToken.empty()) {
        req.set(http::field::authorization, "Bearer " + accessToken);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

HttpJsonClient::Response toResponse(const http::response<http::string_body>& res) {
    HttpJsonClient::Response response;
    response.httpStatus = res.result_int();
    try {
        response.body = nlohmann::json::parse(res.body());
    } catch (const nlohmann::json::parse_error& e) {
        throw BackendError(
            std::string("Failed to parse JSON response: ") + e.what(),
            response.httpStatus);
    }
    return response;
}

// Beast reports deadlines as error::timeout; everything else is a backend failure.
[[noreturn]] void rethrowTransportError(const beast::system_error& e) {
    if (e.code() == beast::error::timeout) {
        throw TimeoutError(std::string("Request timed out: ") + e.what());
    }
    throw BackendError(std::string("Network error: ") + e.what());
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpJsonClient::HttpJsonClient(const std::string& endpoint,
                               const std::string& accessToken,
                               int timeoutMs)
    : mAccessToken(accessToken)
    , mTimeoutMs(timeoutMs)
{
    if (timeoutMs <= 0) {
        throw std::invalid_argument("timeoutMs must be > 0");
    }

    auto parts = parseUrl(endpoint);
    mHost   = parts.host;
    mPort   = parts.port;
    mTarget = parts.target;
    mUseSsl = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef QUERY_STREAM_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpJsonClient::Response
HttpJsonClient::post(const nlohmann::json& payload) const
{
    std::string body = payload.dump();

    if (mVerbose) {
        std::cerr << "[HttpJsonClient] POST " << mHost << ":" << mPort
                  << mTarget << "\n";
        if (body.size() <= 300) {
            std::cerr << "[HttpJsonClient] Body: " << body << "\n";
        } else {
            std::cerr << "[HttpJsonClient] Body: " << body.substr(0, 300)
                      << " ...(truncated)\n";
        }
    }

    try {
        return mUseSsl ? doHttpsRequest(body) : doHttpRequest(body);
    } catch (const beast::system_error& e) {
        rethrowTransportError(e);
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpJsonClient::Response
HttpJsonClient::doHttpRequest(const std::string& requestBody) const
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = makeRequest(mHost, mTarget, mAccessToken, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpJsonClient] HTTP " << response.httpStatus << "\n";
    }

    // Shutdown errors do not affect the response we already hold.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpJsonClient::Response
HttpJsonClient::doHttpsRequest(const std::string& requestBody) const
{
#ifdef QUERY_STREAM_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw BackendError("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = makeRequest(mHost, mTarget, mAccessToken, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpJsonClient] HTTPS " << response.httpStatus << "\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)requestBody;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace query_stream
