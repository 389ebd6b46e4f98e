/// @file test_integration.cpp
/// Integration tests — the IntegrationTest cases need a run-query service
/// listening at localhost:4000 (POST /v1/runQuery).
///
/// If the service is not running, those tests are SKIPPED (not failed).
/// The DatastoreQueryClient cases below them run everywhere.

#include "datastore_client.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "pagination.hpp"
#include "query_result_iterator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

using namespace query_stream;
using json = nlohmann::json;

static const std::string kServiceEndpoint = "http://localhost:4000/v1/runQuery";

// ---------------------------------------------------------------------------
// Check whether the service is reachable before each test.
// ---------------------------------------------------------------------------

static bool isServiceRunning() {
    try {
        HttpJsonClient client(kServiceEndpoint, "", /*timeoutMs=*/2000);
        auto resp = client.post({{"query", {{"kind", "Task"}, {"limit", 1}}}});
        return resp.httpStatus == 200;
    } catch (const std::exception&) {
        return false;
    }
}

class IntegrationTest : public ::testing::Test {
protected:
    IntegrationTest()
        : advisor(advisorOut) {}

    void SetUp() override {
        if (!isServiceRunning()) {
            GTEST_SKIP()
                << "Query service not running at " << kServiceEndpoint
                << ", skipping integration tests.";
        }
    }

    QueryPager::Hooks hooks() {
        QueryPager::Hooks h;
        h.indexRecorder = &recorder;
        h.chunkAdvisor  = &advisor;
        return h;
    }

    static QuerySpec taskQuery() {
        QuerySpec q;
        q.kind = "Task";
        return q;
    }

    IndexUsageRecorder recorder;
    std::ostringstream advisorOut;
    ChunkSizeAdvisor   advisor;
};

// ============================================================================
// Pagination
// ============================================================================

TEST_F(IntegrationTest, IteratesAcrossSeveralChunks) {
    ClientConfig config;
    config.endpoint = kServiceEndpoint;
    DatastoreQueryClient client(config);

    FetchOptions options;
    options.chunkSize = 10;
    options.limit     = 25;

    QueryPager pager(client, client.runQuery(taskQuery(), options),
                     options, taskQuery(), hooks());
    QueryResultIterator it(pager, options);

    std::vector<Entity> all;
    while (it.hasNext()) {
        all.push_back(it.next());
    }
    pager.cancel();

    EXPECT_LE(all.size(), 25u);
    for (const auto& e : all) {
        EXPECT_FALSE(e.key.empty());
    }
    if (all.size() == 25u) {
        EXPECT_GE(pager.getStats().pagesConsumed, 3);
    }
}

TEST_F(IntegrationTest, OffsetSkipsLeadingRecords) {
    ClientConfig config;
    config.endpoint = kServiceEndpoint;
    DatastoreQueryClient client(config);

    FetchOptions plain;
    plain.chunkSize = 5;
    plain.limit     = 8;

    QueryPager firstPager(client, client.runQuery(taskQuery(), plain),
                          plain, taskQuery(), hooks());
    QueryResultIterator first(firstPager, plain);
    auto leading = first.nextList(8);
    firstPager.cancel();

    if (leading.size() < 8u) {
        GTEST_SKIP() << "Not enough Task records to exercise an offset.";
    }

    FetchOptions skipping = plain;
    skipping.offset = 3;
    skipping.limit  = 5;

    QueryPager secondPager(client, client.runQuery(taskQuery(), skipping),
                           skipping, taskQuery(), hooks());
    QueryResultIterator second(secondPager, skipping);
    auto rest = second.nextList(5);
    secondPager.cancel();

    ASSERT_EQ(rest.size(), 5u);
    EXPECT_EQ(second.numSkipped(), 3);
    for (std::size_t i = 0; i < rest.size(); ++i) {
        EXPECT_EQ(rest[i].key, leading[i + 3].key) << "Mismatch at index " << i;
    }
}

TEST_F(IntegrationTest, ResumeCursorContinuesWhereIterationStopped) {
    ClientConfig config;
    config.endpoint = kServiceEndpoint;
    DatastoreQueryClient client(config);

    FetchOptions options;
    options.chunkSize = 4;
    options.limit     = 4;

    QueryPager pager(client, client.runQuery(taskQuery(), options),
                     options, taskQuery(), hooks());
    QueryResultIterator it(pager, options);
    auto firstBatch = it.nextList(4);
    auto resume     = it.cursor();
    pager.cancel();

    if (firstBatch.size() < 4u || !resume) {
        GTEST_SKIP() << "Not enough Task records to exercise resumption.";
    }

    FetchOptions resumed;
    resumed.chunkSize   = 4;
    resumed.limit       = 1;
    resumed.startCursor = resume;

    QueryPager resumedPager(client, client.runQuery(taskQuery(), resumed),
                            resumed, taskQuery(), hooks());
    QueryResultIterator next(resumedPager, resumed);
    if (next.hasNext()) {
        auto e = next.next();
        for (const auto& seen : firstBatch) {
            EXPECT_NE(e.key, seen.key);
        }
    }
    resumedPager.cancel();
}

// ============================================================================
// DatastoreQueryClient without a service
// ============================================================================

TEST(DatastoreQueryClient, RejectsBadConfiguration) {
    ClientConfig noThreads;
    noThreads.threads = 0;
    EXPECT_THROW({ DatastoreQueryClient client(noThreads); }, std::invalid_argument);

    ClientConfig badEndpoint;
    badEndpoint.endpoint = "localhost:4000";
    EXPECT_THROW({ DatastoreQueryClient client(badEndpoint); }, std::invalid_argument);

    ClientConfig noTimeout;
    noTimeout.timeoutMs = 0;
    EXPECT_THROW({ DatastoreQueryClient client(noTimeout); }, std::invalid_argument);
}

TEST(DatastoreQueryClient, UnreachableServiceFailsTheFuture) {
    ClientConfig config;
    config.endpoint  = "http://127.0.0.1:1/v1/runQuery";
    config.timeoutMs = 1000;
    DatastoreQueryClient client(config);

    QuerySpec query;
    query.kind = "Task";
    auto future = client.runQuery(query, FetchOptions{});

    EXPECT_THROW(future.get(), BackendError);
    EXPECT_EQ(client.requestsIssued(), 1);
}
