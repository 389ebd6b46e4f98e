#include "index_usage.hpp"

namespace query_stream {

IndexUsageRecorder& IndexUsageRecorder::global() {
    static IndexUsageRecorder instance;
    return instance;
}

void IndexUsageRecorder::addNewUsage(const std::set<Index>& indexes,
                                     const std::string& queryShape) {
    if (indexes.empty()) return;

    std::set<int64_t> ids;
    for (const auto& index : indexes) {
        ids.insert(index.id);
    }

    std::lock_guard<std::mutex> lock(mMutex);
    auto [it, inserted] = mUsages.try_emplace(Key{ids, queryShape});
    if (inserted) {
        it->second.indexIds   = std::move(ids);
        it->second.queryShape = queryShape;
        it->second.firstSeen  = std::chrono::system_clock::now();
    }
    ++it->second.occurrences;
}

std::vector<IndexUsageRecorder::Usage> IndexUsageRecorder::usages() const {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<Usage> out;
    out.reserve(mUsages.size());
    for (const auto& entry : mUsages) {
        out.push_back(entry.second);
    }
    return out;
}

int IndexUsageRecorder::usageCount(const std::set<int64_t>& indexIds,
                                   const std::string& queryShape) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mUsages.find(Key{indexIds, queryShape});
    return it == mUsages.end() ? 0 : it->second.occurrences;
}

std::size_t IndexUsageRecorder::size() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mUsages.size();
}

void IndexUsageRecorder::clear() {
    std::lock_guard<std::mutex> lock(mMutex);
    mUsages.clear();
}

} // namespace query_stream
