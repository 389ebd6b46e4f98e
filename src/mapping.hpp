#pragma once

#include "fetch_options.hpp"
#include "models.hpp"
#include "page.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace query_stream {

/// Normalize the response to the first request of a query.
/// Reads the result batch plus the index list.
/// Throws BackendError if the expected shape is missing.
Page parseInitialPage(const nlohmann::json& responseBody);

/// Normalize the response to a continuation request.
/// Continuation responses carry no index information.
/// Throws BackendError if the expected shape is missing.
Page parseContinuationPage(const nlohmann::json& responseBody);

/// Map a single entity JSON node into an Entity.
Entity parseEntityNode(const nlohmann::json& node);

/// Map a single index JSON node into an Index.
Index parseIndexNode(const nlohmann::json& node);

/// True when a "moreResults" value says the query can be continued.
bool moreResultsAvailable(const std::string& moreResults);

/// Body of the first request for @p query.
nlohmann::json buildRunQueryRequest(const QuerySpec& query,
                                    const FetchOptions& options);

/// Reusable template for continuation requests, built from the seed result
/// (which echoes the initial request under "request"): that request minus
/// its offset, count hint and start position.
/// Throws BackendError if the seed result carries no request.
nlohmann::json buildContinuationPrototype(const nlohmann::json& seedResult);

/// Body of a continuation request resuming after @p lastPage.
nlohmann::json buildContinuationRequest(const nlohmann::json& prototype,
                                        const Page& lastPage,
                                        std::optional<int> countHint,
                                        std::optional<int> offsetHint);

} // namespace query_stream
