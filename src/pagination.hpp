#pragma once

#include "chunk_size_advisor.hpp"
#include "fetch_options.hpp"
#include "index_usage.hpp"
#include "models.hpp"
#include "page.hpp"
#include "page_future.hpp"
#include "query_client.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace query_stream {

/// Called once per loaded record, in order, before the load call returns.
/// A throw aborts the load call; the record is not appended and the next
/// load call runs the hook on it again.
using PostLoadHook = std::function<void(const TransactionContext&, const Entity&)>;

/// Collaborators of a QueryPager. Null pointers fall back to the
/// process-wide instances.
struct QueryPagerHooks {
    PostLoadHook        postLoad;
    TransactionContext  transaction;
    IndexUsageRecorder* indexRecorder = nullptr;
    ChunkSizeAdvisor*   chunkAdvisor  = nullptr;
};

/// Turns one logical query against a paged remote service into a single
/// ordered stream of records.
///
/// Each load call resolves whatever page is pending, synchronously fetches
/// more until the offset is satisfied and the requested count is met, then
/// starts one asynchronous prefetch for the next page so its latency hides
/// behind the caller's work. At most one prefetch is in flight at a time.
///
/// One instance per query, driven by a single thread.
class QueryPager {
public:
    using Hooks = QueryPagerHooks;

    enum class State {
        InitialPending,  // seed future not yet consumed
        Continuing,      // prototype built, more pages possible
        Exhausted,       // last page said no more, all of it handed out
    };

    struct Stats {
        int pagesConsumed      = 0;
        int syncContinuations  = 0;
        int asyncPrefetches    = 0;
        int totalEmitted       = 0;
    };

    /// @param client         remote query client; must outlive the pager
    /// @param initialResult  future for the seed result of the query
    /// @param options        validated here (throws std::invalid_argument)
    /// @throws std::invalid_argument on an empty @p initialResult
    QueryPager(RemoteQueryClient& client,
               PageFuture initialResult,
               FetchOptions options,
               QuerySpec query,
               QueryPagerHooks hooks = QueryPagerHooks(),
               bool verbose = false);

    QueryPager(const QueryPager&) = delete;
    QueryPager& operator=(const QueryPager&) = delete;

    /// Cheap, no I/O.
    bool hasMoreEntities() const;

    int getNumSkipped() const { return mSkippedSoFar; }

    /// Indexes used by the query. Resolves the seed result (blocking) on the
    /// first call and forwards monitored indexes to the recorder once.
    const std::set<Index>& getIndexList();

    /// Load at least one more record, or confirm exhaustion.
    std::optional<Cursor> loadMoreEntities(std::vector<Entity>& buffer,
                                           std::vector<CursorSlot>& cursorBuffer);

    /// Load up to @p count records beyond any offset still to be skipped.
    /// LoadCount::exactly(0) only satisfies the offset.
    ///
    /// Appends records to @p buffer and their cursors to @p cursorBuffer
    /// (plus, exactly once per query, the skip cursor marking the position
    /// right after the offset). Returns the resume cursor of the last page.
    ///
    /// @throws StalledQueryError    continuation made no progress (terminal)
    /// @throws QueryCancelledError  after cancel()
    /// Client and post-load hook errors propagate unchanged. Records
    /// appended before the error stay in the buffers; the next call resumes
    /// with the record or page that failed.
    std::optional<Cursor> loadMoreEntities(LoadCount count,
                                           std::vector<Entity>& buffer,
                                           std::vector<CursorSlot>& cursorBuffer);

    /// Cancel the pending seed, the prefetch and any call being waited on;
    /// the next load call fails with QueryCancelledError.
    /// May be called from any thread.
    void cancel();

    State state() const;
    Stats getStats() const { return mStats; }

private:
    ChunkSizeAdvisor&   advisor() const;
    IndexUsageRecorder& indexRecorder() const;

    Page resolveNextPage();
    void adoptPage(Page page, std::vector<CursorSlot>& cursorBuffer);
    int  emitPending(std::vector<Entity>& buffer,
                     std::vector<CursorSlot>& cursorBuffer);
    Page fetchContinuation(const Page& previous,
                           std::optional<int> countHint,
                           std::optional<int> offsetHint);
    void startPrefetch(const Page& last);
    nlohmann::json await(PageFuture future);

    RemoteQueryClient&  mClient;
    FetchOptions        mOptions;
    QuerySpec           mQuery;
    Hooks               mHooks;
    bool                mVerbose;

    // Guards the future handles so cancel() can run on another thread.
    mutable std::mutex            mFutureMutex;
    PageFuture                    mInitialFuture;
    PageFuture                    mOutstanding;
    PageFuture                    mAwaiting;
    std::optional<nlohmann::json> mPrototype;
    std::optional<Page>           mSeedPage;
    std::optional<std::set<Index>> mIndexList;
    std::optional<Cursor>         mLastEndCursor;

    // Last page taken from the service and how many of its records were
    // handed out. Continuations resume from it.
    std::optional<Page>           mCurrent;
    std::size_t                   mEmitted = 0;

    int  mSkippedSoFar    = 0;
    bool mSkipCursorAdded = false;
    bool mStalled         = false;
    std::atomic<bool> mCancelled{false};
    Stats mStats{};
};

} // namespace query_stream
