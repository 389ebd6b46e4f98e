#include "mapping.hpp"
#include "errors.hpp"

#include <string>

namespace query_stream {

namespace {

CursorSlot optionalCursor(const nlohmann::json& node, const char* field) {
    if (node.contains(field) && node[field].is_string()) {
        return Cursor{node[field].get<std::string>()};
    }
    return std::nullopt;
}

// Wrong-typed fields surface as nlohmann type errors; report them as a
// malformed response like every other shape problem.
[[noreturn]] void rethrowMalformed(const char* what, const nlohmann::json::exception& e) {
    throw BackendError(std::string("Malformed ") + what + " in response: " + e.what());
}

Page parseBatch(const nlohmann::json& responseBody) {
    if (!responseBody.is_object() || !responseBody.contains("batch")) {
        throw BackendError("Response missing 'batch' field");
    }
    const auto& batch = responseBody["batch"];
    if (!batch.is_object()) {
        throw BackendError("Response 'batch' is not an object");
    }

    Page page;

    // --- results ---
    if (batch.contains("entityResults") && batch["entityResults"].is_array()) {
        for (const auto& result : batch["entityResults"]) {
            if (!result.contains("entity")) {
                throw BackendError("Entity result missing 'entity' field");
            }
            page.addEntity(parseEntityNode(result["entity"]),
                           optionalCursor(result, "cursor"));
        }
    }

    // --- positions ---
    page.setEndCursor(optionalCursor(batch, "endCursor"));
    page.setSkippedResultsCursor(optionalCursor(batch, "skippedCursor"));

    const int skipped = batch.value("skippedResults", 0);
    if (skipped < 0) {
        throw BackendError("Negative 'skippedResults' in response");
    }
    page.setNumSkipped(skipped);

    page.setHasMore(moreResultsAvailable(batch.value("moreResults", "NO_MORE_RESULTS")));
    return page;
}

} // namespace

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

Entity parseEntityNode(const nlohmann::json& node) {
    try {
        Entity e;
        e.key = node.value("key", "");
        if (node.contains("properties") && node["properties"].is_object()) {
            e.properties = node["properties"];
        }
        return e;
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("entity", e);
    }
}

Index parseIndexNode(const nlohmann::json& node) {
    try {
        Index index;
        index.id                = node.value("id", int64_t{0});
        index.kind              = node.value("kind", "");
        index.onlyUseIfRequired = node.value("onlyUseIfRequired", false);
        if (node.contains("properties") && node["properties"].is_array()) {
            for (const auto& prop : node["properties"]) {
                index.properties.push_back(prop.get<std::string>());
            }
        }
        return index;
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("index", e);
    }
}

bool moreResultsAvailable(const std::string& moreResults) {
    // A count hint on our side ends a batch with MORE_RESULTS_AFTER_LIMIT;
    // the query itself is unfinished. An end cursor ends it for good.
    return moreResults == "NOT_FINISHED"
        || moreResults == "MORE_RESULTS_AFTER_LIMIT";
}

Page parseInitialPage(const nlohmann::json& responseBody) {
    Page page = parseContinuationPage(responseBody);

    if (responseBody.contains("indexes") && responseBody["indexes"].is_array()) {
        for (const auto& node : responseBody["indexes"]) {
            page.addIndex(parseIndexNode(node));
        }
    }
    return page;
}

Page parseContinuationPage(const nlohmann::json& responseBody) {
    try {
        return parseBatch(responseBody);
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("batch", e);
    }
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

nlohmann::json buildRunQueryRequest(const QuerySpec& query,
                                    const FetchOptions& options) {
    nlohmann::json q;
    q["kind"] = query.kind;
    if (!query.projections.empty()) {
        q["projection"] = query.projections;
    }
    if (!query.filter.is_null()) {
        q["filter"] = query.filter;
    }
    if (options.offset > 0) {
        q["offset"] = options.offset;
    }
    if (options.prefetchSize) {
        q["limit"] = *options.prefetchSize;
    } else if (options.chunkSize) {
        q["limit"] = *options.chunkSize;
    }
    if (options.startCursor) {
        q["startCursor"] = options.startCursor->token;
    }
    if (options.endCursor) {
        q["endCursor"] = options.endCursor->token;
    }

    nlohmann::json body;
    body["query"] = q;
    if (options.requireCompiledQuery) {
        body["requireCompiledQuery"] = true;
    }
    return body;
}

nlohmann::json buildContinuationPrototype(const nlohmann::json& seedResult) {
    if (!seedResult.is_object() || !seedResult.contains("request")
        || !seedResult["request"].contains("query")) {
        throw BackendError("Seed result missing the echoed 'request.query'");
    }

    nlohmann::json prototype = seedResult["request"];
    auto& q = prototype["query"];
    q.erase("offset");
    q.erase("limit");
    q.erase("startCursor");
    return prototype;
}

nlohmann::json buildContinuationRequest(const nlohmann::json& prototype,
                                        const Page& lastPage,
                                        std::optional<int> countHint,
                                        std::optional<int> offsetHint) {
    nlohmann::json body = prototype;
    auto& q = body["query"];
    if (lastPage.endCursor()) {
        q["startCursor"] = lastPage.endCursor()->token;
    }
    if (countHint) {
        q["limit"] = *countHint;
    }
    if (offsetHint) {
        q["offset"] = *offsetHint;
    }
    return body;
}

} // namespace query_stream
