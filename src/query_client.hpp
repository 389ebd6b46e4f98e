#pragma once

#include "page.hpp"
#include "page_future.hpp"

#include <nlohmann/json.hpp>
#include <optional>

namespace query_stream {

/// Hooks the pager needs from whatever talks to the remote query service.
///
/// Raw results and continuation prototypes are JSON documents the pager
/// never looks into; it only hands them back to the client. The client owns
/// any execution resources behind the futures it returns.
class RemoteQueryClient {
public:
    virtual ~RemoteQueryClient() = default;

    /// Normalize the seed result of a query.
    virtual Page wrapInitial(const nlohmann::json& seedResult) = 0;

    /// Normalize the result of a continuation call.
    virtual Page wrapContinuation(const nlohmann::json& continuationResult) = 0;

    /// Build the template used for every continuation call of this query.
    virtual nlohmann::json buildContinuationPrototype(const nlohmann::json& seedResult) = 0;

    /// Start a continuation call resuming after @p lastPage.
    /// @param countHint   number of records wanted, if any
    /// @param offsetHint  records still to skip, if any
    virtual PageFuture fetchNext(const nlohmann::json& prototype,
                                 const Page& lastPage,
                                 std::optional<int> countHint,
                                 std::optional<int> offsetHint) = 0;
};

} // namespace query_stream
