#pragma once

#include "fetch_options.hpp"
#include "models.hpp"
#include "pagination.hpp"

#include <deque>
#include <optional>
#include <set>
#include <vector>

namespace query_stream {

/// Pull-style view over a QueryPager for application code.
///
/// Buffers what the pager loads and keeps the cursor buffer one slot ahead
/// of the record buffer: the front cursor is always the resume position
/// just before the next record to be returned. Enforces the limit from
/// FetchOptions.
class QueryResultIterator {
public:
    /// @param pager  must outlive the iterator
    QueryResultIterator(QueryPager& pager, const FetchOptions& options);

    bool hasNext();

    /// @throws std::out_of_range when no record is left.
    Entity next();

    /// Up to @p maximumElements records (fewer only at the end of the stream).
    std::vector<Entity> nextList(int maximumElements);

    /// Position right before the next record, when one is known.
    std::optional<Cursor> cursor();

    /// Records skipped so far to satisfy the offset.
    int numSkipped();

    const std::set<Index>& indexList() { return mPager.getIndexList(); }

    int returned() const { return mReturned; }

private:
    bool ensureLoaded(int numberDesired);
    void ensureInitialized();
    std::optional<Cursor> load(LoadCount count);
    void saveNextCursor(std::optional<Cursor> next);
    int  remainingUnderLimit() const;
    Entity popFront();

    QueryPager&                 mPager;
    std::optional<int>          mLimit;
    std::deque<Entity>          mEntities;
    std::deque<CursorSlot>      mCursors;
    std::optional<Cursor>       mNextCursor;
    int                         mReturned = 0;
};

} // namespace query_stream
