#include "fetch_options.hpp"

#include <stdexcept>
#include <string>

namespace query_stream {

void FetchOptions::validate() const {
    if (offset < 0) {
        throw std::invalid_argument(
            "offset must be >= 0, got " + std::to_string(offset));
    }
    if (chunkSize && *chunkSize <= 0) {
        throw std::invalid_argument(
            "chunkSize must be > 0, got " + std::to_string(*chunkSize));
    }
    if (prefetchSize && *prefetchSize <= 0) {
        throw std::invalid_argument(
            "prefetchSize must be > 0, got " + std::to_string(*prefetchSize));
    }
    if (limit && *limit < 0) {
        throw std::invalid_argument(
            "limit must be >= 0, got " + std::to_string(*limit));
    }
}

LoadCount LoadCount::exactly(int n) {
    if (n < 0) {
        throw std::invalid_argument(
            "load count must be >= 0, got " + std::to_string(n));
    }
    return LoadCount(n);
}

} // namespace query_stream
