#include "chunk_size_advisor.hpp"
#include "util.hpp"

#include <iostream>

namespace query_stream {

ChunkSizeAdvisor::ChunkSizeAdvisor(std::ostream& out, Clock clock)
    : mOut(out)
    , mClock(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , mEnabled(!envFlagSet(kDisableEnvVar)) {}

ChunkSizeAdvisor& ChunkSizeAdvisor::global() {
    static ChunkSizeAdvisor instance(std::cerr);
    return instance;
}

bool ChunkSizeAdvisor::observe(bool chunkSizeConfigured, int totalEmitted) {
    if (chunkSizeConfigured || totalEmitted <= kResultThreshold || !enabled()) {
        return false;
    }

    const int64_t nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        mClock().time_since_epoch()).count();
    const int64_t intervalMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(kMinInterval).count();

    int64_t last = mLastWarningMs.load();
    do {
        if (last != kNever && nowMs - last < intervalMs) {
            return false;
        }
    } while (!mLastWarningMs.compare_exchange_weak(last, nowMs));

    ++mWarnings;
    mOut << "[ChunkSizeAdvisor] This query does not have a chunk size set and "
         << "has returned over " << kResultThreshold << " results.  If result "
         << "sets of this size are common for this query, consider setting a "
         << "chunk size to improve performance.  To disable this warning set "
         << "the environment variable " << kDisableEnvVar << ".\n";
    return true;
}

} // namespace query_stream
