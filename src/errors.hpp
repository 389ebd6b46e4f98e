#pragma once

#include <stdexcept>
#include <string>

namespace query_stream {

/// Base for every error raised by this library.
class QueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A continuation page made no progress compared to its predecessor.
/// Terminal for the query that raised it.
class StalledQueryError : public QueryError {
public:
    StalledQueryError()
        : QueryError("The query was not able to make any progress.") {}
};

/// The page future was cancelled before (or while) it was resolved.
class QueryCancelledError : public QueryError {
public:
    QueryCancelledError()
        : QueryError("The query was cancelled.") {}
};

/// Remote service failure: non-success status or malformed response.
class BackendError : public QueryError {
public:
    explicit BackendError(const std::string& message, unsigned int httpStatus = 0)
        : QueryError(message)
        , mHttpStatus(httpStatus) {}

    /// 0 when the failure did not come with an HTTP status.
    unsigned int httpStatus() const { return mHttpStatus; }

private:
    unsigned int mHttpStatus;
};

/// Transport deadline expired before the service answered.
class TimeoutError : public BackendError {
public:
    explicit TimeoutError(const std::string& message)
        : BackendError(message) {}
};

} // namespace query_stream
