#pragma once

#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace query_stream {

/// Append-only record of "use only if required" indexes that queries
/// actually consulted, keyed by (index ids, query shape).
///
/// Safe to share between pagers on different threads.
class IndexUsageRecorder {
public:
    struct Usage {
        std::set<int64_t>                     indexIds;
        std::string                           queryShape;
        int                                   occurrences = 0;
        std::chrono::system_clock::time_point firstSeen;
    };

    IndexUsageRecorder() = default;
    IndexUsageRecorder(const IndexUsageRecorder&) = delete;
    IndexUsageRecorder& operator=(const IndexUsageRecorder&) = delete;

    /// Process-wide instance, created on first use.
    static IndexUsageRecorder& global();

    /// Record that @p indexes were used to execute a query of @p queryShape.
    /// An empty index set is ignored.
    void addNewUsage(const std::set<Index>& indexes, const std::string& queryShape);

    std::vector<Usage> usages() const;
    int  usageCount(const std::set<int64_t>& indexIds, const std::string& queryShape) const;
    std::size_t size() const;

    void clear();

private:
    using Key = std::pair<std::set<int64_t>, std::string>;

    mutable std::mutex mMutex;
    std::map<Key, Usage> mUsages;
};

} // namespace query_stream
