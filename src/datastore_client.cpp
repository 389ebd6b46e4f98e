#include "datastore_client.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace query_stream {

namespace {

std::size_t checkedThreadCount(int threads) {
    if (threads <= 0) {
        throw std::invalid_argument(
            "threads must be > 0, got " + std::to_string(threads));
    }
    return static_cast<std::size_t>(threads);
}

std::string errorMessage(const nlohmann::json& body, unsigned int status) {
    if (body.is_object() && body.contains("error")) {
        const auto& err = body["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
        if (err.is_string()) {
            return err.get<std::string>();
        }
    }
    return "Query service returned HTTP " + std::to_string(status);
}

} // namespace

DatastoreQueryClient::DatastoreQueryClient(const ClientConfig& config)
    : mHttp(config.endpoint, config.accessToken, config.timeoutMs)
    , mPool(checkedThreadCount(config.threads))
    , mVerbose(config.verbose)
{
    mHttp.setVerbose(config.verbose);
}

DatastoreQueryClient::~DatastoreQueryClient() {
    mPool.join();
}

PageFuture DatastoreQueryClient::runQuery(const QuerySpec& query,
                                          const FetchOptions& options) {
    options.validate();
    return submit(buildRunQueryRequest(query, options), /*echoRequest=*/true);
}

Page DatastoreQueryClient::wrapInitial(const nlohmann::json& seedResult) {
    return parseInitialPage(seedResult);
}

Page DatastoreQueryClient::wrapContinuation(const nlohmann::json& continuationResult) {
    return parseContinuationPage(continuationResult);
}

nlohmann::json DatastoreQueryClient::buildContinuationPrototype(const nlohmann::json& seedResult) {
    return query_stream::buildContinuationPrototype(seedResult);
}

PageFuture DatastoreQueryClient::fetchNext(const nlohmann::json& prototype,
                                           const Page& lastPage,
                                           std::optional<int> countHint,
                                           std::optional<int> offsetHint) {
    return submit(buildContinuationRequest(prototype, lastPage, countHint, offsetHint),
                  /*echoRequest=*/false);
}

PageFuture DatastoreQueryClient::submit(nlohmann::json request, bool echoRequest) {
    PagePromise promise;
    PageFuture  future = promise.future();

    boost::asio::post(mPool, [this, promise, request = std::move(request), echoRequest]() mutable {
        if (promise.isCancelled()) {
            if (mVerbose) {
                std::cerr << "[DatastoreQueryClient] Skipping cancelled request\n";
            }
            return;
        }

        try {
            ++mRequestsIssued;
            auto resp = mHttp.post(request);
            if (resp.httpStatus >= 400) {
                throw BackendError(errorMessage(resp.body, resp.httpStatus),
                                   resp.httpStatus);
            }

            nlohmann::json result = std::move(resp.body);
            if (echoRequest) {
                result["request"] = request;
            }
            promise.setValue(std::move(result));
        } catch (...) {
            // Delivered to whoever resolves the future.
            promise.setException(std::current_exception());
        }
    });

    return future;
}

} // namespace query_stream
