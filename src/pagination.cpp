#include "pagination.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace query_stream {

QueryPager::QueryPager(RemoteQueryClient& client,
                       PageFuture initialResult,
                       FetchOptions options,
                       QuerySpec query,
                       Hooks hooks,
                       bool verbose)
    : mClient(client)
    , mOptions(std::move(options))
    , mQuery(std::move(query))
    , mHooks(std::move(hooks))
    , mVerbose(verbose)
    , mInitialFuture(std::move(initialResult))
{
    mOptions.validate();
    if (!mInitialFuture.valid()) {
        throw std::invalid_argument("QueryPager needs a seed result future");
    }
}

// ---------------------------------------------------------------------------
// Public: queries about the stream
// ---------------------------------------------------------------------------

bool QueryPager::hasMoreEntities() const {
    if (!mPrototype || mOutstanding.valid()) {
        return true;
    }
    // A failed load leaves records or pages behind the current page.
    return mCurrent && (mEmitted < mCurrent->size() || mCurrent->hasMoreResults());
}

QueryPager::State QueryPager::state() const {
    if (!mPrototype) return State::InitialPending;
    if (mStalled || hasMoreEntities()) return State::Continuing;
    return State::Exhausted;
}

const std::set<Index>& QueryPager::getIndexList() {
    if (!mIndexList) {
        // The seed result carries the index list.
        Page seed = mClient.wrapInitial(await(mInitialFuture));

        std::set<Index> monitored;
        std::set<Index> used = seed.indexesUsed(monitored);
        if (!monitored.empty()) {
            indexRecorder().addNewUsage(monitored, mQuery.shape());
        }

        mIndexList = std::move(used);
        mSeedPage  = std::move(seed);
    }
    return *mIndexList;
}

void QueryPager::cancel() {
    mCancelled.store(true);

    std::lock_guard<std::mutex> lock(mFutureMutex);
    mInitialFuture.cancel();   // no-op once resolved
    mOutstanding.cancel();
    mAwaiting.cancel();
}

// ---------------------------------------------------------------------------
// Public: loading
// ---------------------------------------------------------------------------

std::optional<Cursor> QueryPager::loadMoreEntities(std::vector<Entity>& buffer,
                                                   std::vector<CursorSlot>& cursorBuffer) {
    return loadMoreEntities(LoadCount::unbounded(), buffer, cursorBuffer);
}

std::optional<Cursor> QueryPager::loadMoreEntities(LoadCount count,
                                                   std::vector<Entity>& buffer,
                                                   std::vector<CursorSlot>& cursorBuffer) {
    if (mStalled) {
        throw StalledQueryError();
    }
    if (!hasMoreEntities()) {
        return mLastEndCursor;
    }
    if (mCancelled.load()) {
        throw QueryCancelledError();
    }

    const int offset = mOptions.offset;

    // Request to satisfy the offset only, which may already be satisfied.
    if (!count.isUnbounded() && count.count() == 0 && mSkippedSoFar >= offset) {
        if (!mSkipCursorAdded) {
            cursorBuffer.push_back(std::nullopt);  // the start of the query
            mSkipCursorAdded = true;
        }
        return std::nullopt;
    }

    // Take a new page unless the last load stopped part way through the
    // current one, or failed before its continuation came back.
    const bool pageFinished = mCurrent && mEmitted >= mCurrent->size();
    if (!mCurrent || (pageFinished && mOutstanding.valid())) {
        adoptPage(resolveNextPage(), cursorBuffer);
    }
    int fetchedSoFar = emitPending(buffer, cursorBuffer);

    if (mCurrent->hasMoreResults()) {
        // "At least one" and "offset only" do not track a count: they use
        // the configured chunk size (or no hint) for every call.
        const bool trackCount = !count.isUnbounded() && count.count() > 0;
        const int  wanted     = count.isUnbounded() ? 1 : count.count();

        std::optional<int> countHint;
        if (!trackCount) {
            countHint = mOptions.chunkSize;
        }

        while (mCurrent->hasMoreResults()
               && (mSkippedSoFar < offset || fetchedSoFar < wanted)) {
            std::optional<int> offsetHint;
            if (mSkippedSoFar < offset) {
                offsetHint = offset - mSkippedSoFar;
            }
            if (trackCount) {
                const int needed = std::max(mOptions.chunkSize.value_or(0),
                                            wanted - fetchedSoFar);
                countHint = needed > 0 ? std::optional<int>(needed) : std::optional<int>();
            }

            Page next = fetchContinuation(*mCurrent, countHint, offsetHint);
            if (!next.madeProgress(*mCurrent)) {
                mStalled = true;
                if (mVerbose) {
                    std::cerr << "[QueryPager] Continuation made no progress "
                              << "(skipped=" << mSkippedSoFar
                              << ", fetched=" << fetchedSoFar << "); giving up.\n";
                }
                throw StalledQueryError();
            }
            adoptPage(std::move(next), cursorBuffer);
            fetchedSoFar += emitPending(buffer, cursorBuffer);
        }
    }

    // Hide the next round trip behind the caller's work.
    if (mCurrent->hasMoreResults()) {
        startPrefetch(*mCurrent);
    }

    mLastEndCursor = mCurrent->endCursor();
    return mLastEndCursor;
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

ChunkSizeAdvisor& QueryPager::advisor() const {
    return mHooks.chunkAdvisor ? *mHooks.chunkAdvisor : ChunkSizeAdvisor::global();
}

IndexUsageRecorder& QueryPager::indexRecorder() const {
    return mHooks.indexRecorder ? *mHooks.indexRecorder : IndexUsageRecorder::global();
}

nlohmann::json QueryPager::await(PageFuture future) {
    {
        std::lock_guard<std::mutex> lock(mFutureMutex);
        mAwaiting = future;
    }
    if (mCancelled.load()) {
        future.cancel();
    }

    auto release = [this] {
        std::lock_guard<std::mutex> lock(mFutureMutex);
        mAwaiting = PageFuture();
    };

    try {
        nlohmann::json result = future.get();
        release();
        return result;
    } catch (...) {
        release();
        throw;
    }
}

Page QueryPager::resolveNextPage() {
    if (!mPrototype) {
        getIndexList();  // fills mSeedPage

        nlohmann::json prototype = mClient.buildContinuationPrototype(await(mInitialFuture));
        Page seed = std::move(*mSeedPage);
        mSeedPage.reset();
        mPrototype = std::move(prototype);
        ++mStats.pagesConsumed;

        if (mVerbose) {
            std::cerr << "[QueryPager] Seed page: " << seed.size()
                      << " records, " << seed.numSkippedResults() << " skipped"
                      << (seed.hasMoreResults() ? ", more available" : "") << "\n";
        }
        return seed;
    }

    // The slot is cleared only once the page is in hand, so a failed
    // resolution can be retried.
    Page page = mClient.wrapContinuation(await(mOutstanding));
    {
        std::lock_guard<std::mutex> lock(mFutureMutex);
        mOutstanding = PageFuture();
    }
    ++mStats.pagesConsumed;
    return page;
}

Page QueryPager::fetchContinuation(const Page& previous,
                                   std::optional<int> countHint,
                                   std::optional<int> offsetHint) {
    if (mVerbose) {
        std::cerr << "[QueryPager] Continuation: count="
                  << (countHint ? std::to_string(*countHint) : "none")
                  << ", offset="
                  << (offsetHint ? std::to_string(*offsetHint) : "none") << "\n";
    }

    PageFuture future = mClient.fetchNext(*mPrototype, previous, countHint, offsetHint);
    ++mStats.syncContinuations;

    Page page = mClient.wrapContinuation(await(std::move(future)));
    ++mStats.pagesConsumed;
    return page;
}

void QueryPager::startPrefetch(const Page& last) {
    // The offset is satisfied by now.
    PageFuture future = mClient.fetchNext(*mPrototype, last, mOptions.chunkSize, std::nullopt);
    {
        std::lock_guard<std::mutex> lock(mFutureMutex);
        mOutstanding = std::move(future);
        if (mCancelled.load()) {
            mOutstanding.cancel();
        }
    }
    ++mStats.asyncPrefetches;

    if (mVerbose) {
        std::cerr << "[QueryPager] Prefetch started (count="
                  << (mOptions.chunkSize ? std::to_string(*mOptions.chunkSize) : "none")
                  << ")\n";
    }
}

void QueryPager::adoptPage(Page page, std::vector<CursorSlot>& cursorBuffer) {
    mSkippedSoFar += page.numSkippedResults();
    if (mSkippedSoFar >= mOptions.offset && !mSkipCursorAdded) {
        // An empty slot falls back to the start of the query.
        cursorBuffer.push_back(page.skippedResultsCursor());
        mSkipCursorAdded = true;
    }
    mCurrent = std::move(page);
    mEmitted = 0;
}

int QueryPager::emitPending(std::vector<Entity>& buffer,
                            std::vector<CursorSlot>& cursorBuffer) {
    const std::vector<Entity> entities = mCurrent->entities(mQuery.projections);
    const std::vector<CursorSlot>& cursors = mCurrent->resultCursors();

    int added = 0;
    while (mEmitted < entities.size()) {
        const Entity& entity = entities[mEmitted];
        if (mHooks.postLoad) {
            mHooks.postLoad(mHooks.transaction, entity);
        }
        buffer.push_back(entity);
        cursorBuffer.push_back(mEmitted < cursors.size() ? cursors[mEmitted] : CursorSlot());
        ++mEmitted;
        ++added;
        ++mStats.totalEmitted;
    }

    if (added > 0) {
        advisor().observe(mOptions.chunkSize.has_value(), mStats.totalEmitted);
    }
    return added;
}

} // namespace query_stream
