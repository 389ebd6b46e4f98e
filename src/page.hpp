#pragma once

#include "models.hpp"

#include <set>
#include <vector>

namespace query_stream {

/// One normalized response from the remote query service.
///
/// Pages come from two construction sites (the seed result of a query and
/// each continuation result) but always share this shape, so the pager never
/// needs to know which call produced a page.
class Page {
public:
    Page() = default;

    // ---- accessors used by the pager ----

    const CursorSlot& endCursor() const { return mEndCursor; }

    /// Records in service order. With a non-empty @p projections, only the
    /// named properties are kept on each record.
    std::vector<Entity> entities(const std::vector<Projection>& projections) const;

    /// One slot per record, parallel to entities().
    const std::vector<CursorSlot>& resultCursors() const { return mResultCursors; }

    /// Position just after the last record skipped to satisfy an offset.
    const CursorSlot& skippedResultsCursor() const { return mSkippedResultsCursor; }

    bool hasMoreResults() const { return mHasMore; }
    int  numSkippedResults() const { return mNumSkipped; }

    /// Indexes the service used for this page. Those flagged
    /// onlyUseIfRequired are also added to @p observedBuffer.
    std::set<Index> indexesUsed(std::set<Index>& observedBuffer) const;

    /// False when this page is indistinguishable from @p previous in resume
    /// position, skip count and record count.
    bool madeProgress(const Page& previous) const;

    std::size_t size() const { return mEntities.size(); }

    // ---- construction ----

    Page& setEndCursor(CursorSlot cursor);
    Page& setSkippedResultsCursor(CursorSlot cursor);
    Page& setNumSkipped(int n);
    Page& setHasMore(bool more);
    Page& addEntity(Entity entity, CursorSlot cursor);
    Page& addIndex(Index index);

private:
    std::vector<Entity>     mEntities;
    std::vector<CursorSlot> mResultCursors;
    CursorSlot              mEndCursor;
    CursorSlot              mSkippedResultsCursor;
    int                     mNumSkipped = 0;
    bool                    mHasMore    = false;
    std::vector<Index>      mIndexes;
};

} // namespace query_stream
