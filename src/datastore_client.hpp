#pragma once

#include "fetch_options.hpp"
#include "http_client.hpp"
#include "models.hpp"
#include "query_client.hpp"

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <optional>
#include <string>

namespace query_stream {

/// Connection settings for DatastoreQueryClient.
struct ClientConfig {
    std::string endpoint    = "http://localhost:4000/v1/runQuery";
    std::string accessToken;
    int         timeoutMs   = 5000;
    int         threads     = 2;
    bool        verbose     = false;
};

/// RemoteQueryClient speaking the run-query JSON protocol over HTTP.
///
/// Every request runs on the client's own worker pool and is handed back as
/// a PageFuture; requests whose future was cancelled before they started are
/// not sent. The destructor waits for requests already queued.
class DatastoreQueryClient : public RemoteQueryClient {
public:
    /// @throws std::invalid_argument on a bad endpoint, timeout or thread count
    explicit DatastoreQueryClient(const ClientConfig& config);
    ~DatastoreQueryClient() override;

    DatastoreQueryClient(const DatastoreQueryClient&) = delete;
    DatastoreQueryClient& operator=(const DatastoreQueryClient&) = delete;

    /// Issue the first request of @p query. The result echoes the request so
    /// the continuation prototype can be built from it.
    PageFuture runQuery(const QuerySpec& query, const FetchOptions& options);

    // ---- RemoteQueryClient ----
    Page wrapInitial(const nlohmann::json& seedResult) override;
    Page wrapContinuation(const nlohmann::json& continuationResult) override;
    nlohmann::json buildContinuationPrototype(const nlohmann::json& seedResult) override;
    PageFuture fetchNext(const nlohmann::json& prototype,
                         const Page& lastPage,
                         std::optional<int> countHint,
                         std::optional<int> offsetHint) override;

    int requestsIssued() const { return mRequestsIssued.load(); }

private:
    PageFuture submit(nlohmann::json request, bool echoRequest);

    HttpJsonClient            mHttp;
    boost::asio::thread_pool  mPool;
    std::atomic<int>          mRequestsIssued{0};
    bool                      mVerbose;
};

} // namespace query_stream
