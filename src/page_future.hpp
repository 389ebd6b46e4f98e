#pragma once

#include <nlohmann/json.hpp>
#include <exception>
#include <memory>

namespace query_stream {

namespace detail {
struct PageState;
} // namespace detail

/// Consumer side of one raw page result that may still be in flight.
///
/// get() blocks the calling thread until the producer delivers a value or an
/// error, or until the future is cancelled. It can be called more than once
/// and yields the same outcome each time.
class PageFuture {
public:
    PageFuture() = default;

    /// Already-resolved futures.
    static PageFuture ready(nlohmann::json value);
    static PageFuture failed(std::exception_ptr error);

    bool valid() const { return static_cast<bool>(mState); }

    /// True once a value, an error or a cancellation is recorded.
    bool isReady() const;
    bool isCancelled() const;

    /// @throws QueryCancelledError if cancelled, or the producer's error.
    /// @throws std::logic_error on a default-constructed future.
    nlohmann::json get() const;

    /// Wake any waiter; a value delivered afterwards is dropped.
    void cancel();

private:
    friend class PagePromise;
    explicit PageFuture(std::shared_ptr<detail::PageState> state)
        : mState(std::move(state)) {}

    std::shared_ptr<detail::PageState> mState;
};

/// Producer side, handed to whatever executes the remote call.
class PagePromise {
public:
    PagePromise();

    PageFuture future() const { return PageFuture(mState); }

    /// Lets the producer skip work nobody is waiting for.
    bool isCancelled() const;

    /// Each returns false when the outcome was already decided
    /// (a prior value, error or cancellation).
    bool setValue(nlohmann::json value);
    bool setException(std::exception_ptr error);

private:
    std::shared_ptr<detail::PageState> mState;
};

} // namespace query_stream
