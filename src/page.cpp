#include "page.hpp"

#include <stdexcept>
#include <string>

namespace query_stream {

std::vector<Entity> Page::entities(const std::vector<Projection>& projections) const {
    if (projections.empty()) {
        return mEntities;
    }

    std::vector<Entity> projected;
    projected.reserve(mEntities.size());
    for (const auto& entity : mEntities) {
        Entity e;
        e.key = entity.key;
        for (const auto& name : projections) {
            if (entity.properties.contains(name)) {
                e.properties[name] = entity.properties.at(name);
            }
        }
        projected.push_back(std::move(e));
    }
    return projected;
}

std::set<Index> Page::indexesUsed(std::set<Index>& observedBuffer) const {
    std::set<Index> used;
    for (const auto& index : mIndexes) {
        used.insert(index);
        if (index.onlyUseIfRequired) {
            observedBuffer.insert(index);
        }
    }
    return used;
}

bool Page::madeProgress(const Page& previous) const {
    return mEndCursor != previous.mEndCursor
        || mNumSkipped != previous.mNumSkipped
        || mEntities.size() != previous.mEntities.size();
}

Page& Page::setEndCursor(CursorSlot cursor) {
    mEndCursor = std::move(cursor);
    return *this;
}

Page& Page::setSkippedResultsCursor(CursorSlot cursor) {
    mSkippedResultsCursor = std::move(cursor);
    return *this;
}

Page& Page::setNumSkipped(int n) {
    if (n < 0) {
        throw std::invalid_argument(
            "skipped result count must be >= 0, got " + std::to_string(n));
    }
    mNumSkipped = n;
    return *this;
}

Page& Page::setHasMore(bool more) {
    mHasMore = more;
    return *this;
}

Page& Page::addEntity(Entity entity, CursorSlot cursor) {
    mEntities.push_back(std::move(entity));
    mResultCursors.push_back(std::move(cursor));
    return *this;
}

Page& Page::addIndex(Index index) {
    mIndexes.push_back(std::move(index));
    return *this;
}

} // namespace query_stream
