/// @file test_mapping.cpp
/// Unit tests for mapping.hpp — run-query responses to Pages, and request bodies.

#include "mapping.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace query_stream;
using json = nlohmann::json;

// ============================================================================
// parseEntityNode / parseIndexNode
// ============================================================================

TEST(ParseEntityNode, FullNode) {
    json node = {{"key", "Task/7"}, {"properties", {{"title", "Write docs"}, {"done", false}}}};

    auto e = parseEntityNode(node);
    EXPECT_EQ(e.key, "Task/7");
    EXPECT_EQ(e.properties["title"], "Write docs");
    EXPECT_EQ(e.properties["done"], false);
}

TEST(ParseEntityNode, MissingFieldsDefaultToEmpty) {
    auto e = parseEntityNode(json::object());
    EXPECT_EQ(e.key, "");
    EXPECT_TRUE(e.properties.is_object());
    EXPECT_TRUE(e.properties.empty());
}

TEST(ParseIndexNode, FullNode) {
    json node = {{"id", 42}, {"kind", "Task"}, {"onlyUseIfRequired", true},
                 {"properties", json::array({"owner", "created"})}};

    auto index = parseIndexNode(node);
    EXPECT_EQ(index.id, 42);
    EXPECT_EQ(index.kind, "Task");
    EXPECT_TRUE(index.onlyUseIfRequired);
    EXPECT_EQ(index.properties, (std::vector<std::string>{"owner", "created"}));
}

TEST(ParseIndexNode, DefaultsToUnmonitored) {
    auto index = parseIndexNode({{"id", 1}});
    EXPECT_FALSE(index.onlyUseIfRequired);
    EXPECT_TRUE(index.properties.empty());
}

// ============================================================================
// moreResultsAvailable
// ============================================================================

TEST(MoreResults, ContinuableStates) {
    EXPECT_TRUE(moreResultsAvailable("NOT_FINISHED"));
    EXPECT_TRUE(moreResultsAvailable("MORE_RESULTS_AFTER_LIMIT"));
}

TEST(MoreResults, FinalStates) {
    EXPECT_FALSE(moreResultsAvailable("NO_MORE_RESULTS"));
    EXPECT_FALSE(moreResultsAvailable("MORE_RESULTS_AFTER_CURSOR"));
    EXPECT_FALSE(moreResultsAvailable(""));
}

// ============================================================================
// parseInitialPage / parseContinuationPage
// ============================================================================

static json sampleResponse() {
    return {
        {"batch", {
            {"entityResults", {
                {{"entity", {{"key", "Task/1"}, {"properties", {{"title", "A"}}}}}, {"cursor", "c1"}},
                {{"entity", {{"key", "Task/2"}, {"properties", {{"title", "B"}}}}}}
            }},
            {"endCursor", "end-c2"},
            {"skippedCursor", "skip-c"},
            {"skippedResults", 4},
            {"moreResults", "MORE_RESULTS_AFTER_LIMIT"}
        }},
        {"indexes", {
            {{"id", 10}, {"onlyUseIfRequired", true}},
            {{"id", 11}}
        }}
    };
}

TEST(ParseInitialPage, FullResponse) {
    auto page = parseInitialPage(sampleResponse());

    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page.entities({})[1].key, "Task/2");
    EXPECT_EQ(page.resultCursors()[0], std::optional<Cursor>(Cursor{"c1"}));
    EXPECT_FALSE(page.resultCursors()[1].has_value());
    EXPECT_EQ(page.endCursor(), std::optional<Cursor>(Cursor{"end-c2"}));
    EXPECT_EQ(page.skippedResultsCursor(), std::optional<Cursor>(Cursor{"skip-c"}));
    EXPECT_EQ(page.numSkippedResults(), 4);
    EXPECT_TRUE(page.hasMoreResults());

    std::set<Index> monitored;
    EXPECT_EQ(page.indexesUsed(monitored).size(), 2u);
    ASSERT_EQ(monitored.size(), 1u);
    EXPECT_EQ(monitored.begin()->id, 10);
}

TEST(ParseContinuationPage, IgnoresIndexes) {
    auto page = parseContinuationPage(sampleResponse());

    std::set<Index> monitored;
    EXPECT_TRUE(page.indexesUsed(monitored).empty());
    EXPECT_TRUE(monitored.empty());
    EXPECT_EQ(page.size(), 2u);
}

TEST(ParseContinuationPage, EmptyBatchIsFinal) {
    auto page = parseContinuationPage({{"batch", json::object()}});
    EXPECT_EQ(page.size(), 0u);
    EXPECT_FALSE(page.hasMoreResults());
    EXPECT_EQ(page.numSkippedResults(), 0);
    EXPECT_FALSE(page.endCursor().has_value());
}

TEST(ParseContinuationPage, MissingBatchThrows) {
    EXPECT_THROW(parseContinuationPage({{"error", "nope"}}), BackendError);
    EXPECT_THROW(parseContinuationPage({{"batch", "oops"}}), BackendError);
    EXPECT_THROW(parseContinuationPage(json::array()), BackendError);
}

TEST(ParseContinuationPage, NegativeSkipCountThrows) {
    EXPECT_THROW(parseContinuationPage({{"batch", {{"skippedResults", -1}}}}), BackendError);
}

TEST(ParseContinuationPage, ResultWithoutEntityThrows) {
    json body = {{"batch", {{"entityResults", {{{"cursor", "c"}}}}}}};
    EXPECT_THROW(parseContinuationPage(body), BackendError);
}

TEST(ParseContinuationPage, WrongTypedFieldsThrowBackendError) {
    EXPECT_THROW(parseContinuationPage({{"batch", {{"skippedResults", "many"}}}}),
                 BackendError);
    EXPECT_THROW(parseContinuationPage({{"batch", {{"moreResults", 3}}}}), BackendError);

    json badKey = {{"batch", {{"entityResults", {{{"entity", {{"key", 5}}}}}}}}};
    EXPECT_THROW(parseContinuationPage(badKey), BackendError);
}

TEST(ParseInitialPage, WrongTypedIndexThrowsBackendError) {
    json body = {{"batch", json::object()},
                 {"indexes", {{{"id", 1}, {"properties", json::array({1})}}}}};
    EXPECT_THROW(parseInitialPage(body), BackendError);

    EXPECT_THROW(parseIndexNode({{"id", "ten"}}), BackendError);
    EXPECT_THROW(parseEntityNode(json::array()), BackendError);
}

// ============================================================================
// Requests
// ============================================================================

TEST(BuildRunQueryRequest, CarriesQueryAndOptions) {
    QuerySpec query;
    query.kind        = "Task";
    query.projections = {"title"};
    query.filter      = {{"property", "done"}, {"op", "EQUAL"}, {"value", false}};

    FetchOptions options;
    options.offset      = 5;
    options.chunkSize   = 20;
    options.startCursor = Cursor{"from-here"};
    options.requireCompiledQuery = true;

    auto body = buildRunQueryRequest(query, options);
    const auto& q = body["query"];
    EXPECT_EQ(q["kind"], "Task");
    EXPECT_EQ(q["projection"], json::array({"title"}));
    EXPECT_EQ(q["filter"]["op"], "EQUAL");
    EXPECT_EQ(q["offset"], 5);
    EXPECT_EQ(q["limit"], 20);
    EXPECT_EQ(q["startCursor"], "from-here");
    EXPECT_FALSE(q.contains("endCursor"));
    EXPECT_EQ(body["requireCompiledQuery"], true);
}

TEST(BuildRunQueryRequest, PrefetchSizeWinsOverChunkSize) {
    QuerySpec query;
    query.kind = "Task";
    FetchOptions options;
    options.chunkSize    = 20;
    options.prefetchSize = 50;

    auto body = buildRunQueryRequest(query, options);
    EXPECT_EQ(body["query"]["limit"], 50);
    EXPECT_FALSE(body["query"].contains("offset"));
    EXPECT_FALSE(body.contains("requireCompiledQuery"));
}

TEST(BuildContinuationPrototype, DropsPositionAndCount) {
    json seed = {
        {"batch", json::object()},
        {"request", {{"query", {{"kind", "Task"}, {"offset", 5}, {"limit", 20},
                                {"startCursor", "s"}, {"endCursor", "e"}}}}}
    };

    auto proto = buildContinuationPrototype(seed);
    const auto& q = proto["query"];
    EXPECT_EQ(q["kind"], "Task");
    EXPECT_EQ(q["endCursor"], "e");
    EXPECT_FALSE(q.contains("offset"));
    EXPECT_FALSE(q.contains("limit"));
    EXPECT_FALSE(q.contains("startCursor"));
}

TEST(BuildContinuationPrototype, MissingEchoedRequestThrows) {
    EXPECT_THROW(buildContinuationPrototype({{"batch", json::object()}}), BackendError);
}

TEST(BuildContinuationRequest, ResumesAfterLastPage) {
    json proto = {{"query", {{"kind", "Task"}}}};
    Page last;
    last.setEndCursor(Cursor{"end-9"});

    auto body = buildContinuationRequest(proto, last, 10, 3);
    EXPECT_EQ(body["query"]["startCursor"], "end-9");
    EXPECT_EQ(body["query"]["limit"], 10);
    EXPECT_EQ(body["query"]["offset"], 3);

    auto bare = buildContinuationRequest(proto, last, std::nullopt, std::nullopt);
    EXPECT_FALSE(bare["query"].contains("limit"));
    EXPECT_FALSE(bare["query"].contains("offset"));
    // The prototype itself is untouched.
    EXPECT_FALSE(proto["query"].contains("startCursor"));
}
