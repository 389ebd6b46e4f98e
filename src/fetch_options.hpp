#pragma once

#include "models.hpp"

#include <optional>

namespace query_stream {

/// Read-only per-query configuration supplied when a pager is constructed.
struct FetchOptions {
    int                   offset = 0;
    std::optional<int>    chunkSize;      // count hint for continuation calls
    std::optional<int>    limit;          // enforced by the iterator, not the pager
    std::optional<int>    prefetchSize;   // count hint for the initial request
    std::optional<Cursor> startCursor;
    std::optional<Cursor> endCursor;
    bool                  requireCompiledQuery = false;

    /// Throws std::invalid_argument on out-of-range values.
    void validate() const;
};

/// How many records a load call should produce.
/// Either "at least one" (unbounded) or an exact count (possibly zero).
class LoadCount {
public:
    static LoadCount unbounded() { return LoadCount(std::nullopt); }

    /// Throws std::invalid_argument if @p n is negative.
    static LoadCount exactly(int n);

    bool isUnbounded() const { return !mCount.has_value(); }
    int  count() const { return mCount.value_or(1); }

private:
    explicit LoadCount(std::optional<int> count) : mCount(count) {}

    std::optional<int> mCount;
};

} // namespace query_stream
