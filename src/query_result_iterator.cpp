#include "query_result_iterator.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace query_stream {

QueryResultIterator::QueryResultIterator(QueryPager& pager, const FetchOptions& options)
    : mPager(pager)
    , mLimit(options.limit)
    , mNextCursor(options.startCursor) {}

bool QueryResultIterator::hasNext() {
    return ensureLoaded(1);
}

Entity QueryResultIterator::next() {
    if (!ensureLoaded(1)) {
        throw std::out_of_range("QueryResultIterator::next() past the end");
    }
    return popFront();
}

std::vector<Entity> QueryResultIterator::nextList(int maximumElements) {
    if (maximumElements < 0) {
        throw std::invalid_argument("maximumElements must be >= 0");
    }
    const int wanted = std::min(maximumElements, remainingUnderLimit());
    ensureLoaded(wanted);

    const int n = std::min(wanted, static_cast<int>(mEntities.size()));
    std::vector<Entity> out;
    out.reserve(n);
    for (int i = 0; i < n; ++i) {
        out.push_back(popFront());
    }
    return out;
}

std::optional<Cursor> QueryResultIterator::cursor() {
    ensureInitialized();

    if (!mCursors.empty() && mCursors.front()) {
        return mCursors.front();
    }
    if (mEntities.empty()) {
        return mNextCursor;
    }
    // Records are buffered but the service gave no cursor for this spot.
    return std::nullopt;
}

int QueryResultIterator::numSkipped() {
    ensureInitialized();
    return mPager.getNumSkipped();
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

int QueryResultIterator::remainingUnderLimit() const {
    if (!mLimit) return std::numeric_limits<int>::max();
    return std::max(0, *mLimit - mReturned);
}

bool QueryResultIterator::ensureLoaded(int numberDesired) {
    numberDesired = std::min(numberDesired, remainingUnderLimit());
    if (numberDesired <= 0) {
        return false;
    }

    const int numberToLoad = numberDesired - static_cast<int>(mEntities.size());
    if (numberToLoad > 0 && mPager.hasMoreEntities()) {
        // "At least one" lets the pager use its chunk size.
        const LoadCount count = numberDesired == 1
            ? LoadCount::unbounded()
            : LoadCount::exactly(numberToLoad);
        saveNextCursor(load(count));
    }
    return static_cast<int>(mEntities.size()) >= numberDesired;
}

void QueryResultIterator::ensureInitialized() {
    saveNextCursor(load(LoadCount::exactly(0)));
}

std::optional<Cursor> QueryResultIterator::load(LoadCount count) {
    std::vector<Entity>     entities;
    std::vector<CursorSlot> cursors;
    auto keep = [&] {
        mEntities.insert(mEntities.end(), entities.begin(), entities.end());
        mCursors.insert(mCursors.end(), cursors.begin(), cursors.end());
    };

    std::optional<Cursor> next;
    try {
        next = mPager.loadMoreEntities(count, entities, cursors);
    } catch (const std::exception&) {
        // Records loaded before the failure are still part of the stream.
        keep();
        throw;
    }
    keep();
    return next;
}

void QueryResultIterator::saveNextCursor(std::optional<Cursor> next) {
    if (next) {
        mNextCursor = std::move(next);
    }
}

Entity QueryResultIterator::popFront() {
    Entity e = std::move(mEntities.front());
    mEntities.pop_front();
    if (!mCursors.empty()) {
        mCursors.pop_front();
    }
    ++mReturned;
    return e;
}

} // namespace query_stream
