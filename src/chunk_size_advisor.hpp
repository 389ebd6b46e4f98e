#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>

namespace query_stream {

/// Suggests configuring a chunk size when a query without one streams a
/// large result set. Purely advisory: never affects paging.
///
/// The rate limit is shared by every pager using the same advisor, so the
/// process-wide instance prints at most once per interval.
class ChunkSizeAdvisor {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr int kResultThreshold = 1000;
    static constexpr std::chrono::minutes kMinInterval{5};
    static constexpr const char* kDisableEnvVar =
        "QUERY_STREAM_DISABLE_CHUNK_SIZE_WARNING";

    /// @param out    where the advisory is written
    /// @param clock  time source for the rate limit (steady_clock by default)
    explicit ChunkSizeAdvisor(std::ostream& out, Clock clock = {});

    ChunkSizeAdvisor(const ChunkSizeAdvisor&) = delete;
    ChunkSizeAdvisor& operator=(const ChunkSizeAdvisor&) = delete;

    /// Process-wide instance writing to std::cerr.
    static ChunkSizeAdvisor& global();

    /// Called after each page with the running total for one query.
    /// Returns true if the advisory was written by this call.
    bool observe(bool chunkSizeConfigured, int totalEmitted);

    void setEnabled(bool enabled) { mEnabled.store(enabled); }
    bool enabled() const { return mEnabled.load(); }

    int  warningsIssued() const { return mWarnings.load(); }

private:
    static constexpr int64_t kNever = std::numeric_limits<int64_t>::min();

    std::ostream&        mOut;
    Clock                mClock;
    std::atomic<bool>    mEnabled;
    std::atomic<int64_t> mLastWarningMs{kNever};
    std::atomic<int>     mWarnings{0};
};

} // namespace query_stream
