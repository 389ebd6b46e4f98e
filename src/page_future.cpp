#include "page_future.hpp"
#include "errors.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace query_stream {

namespace detail {

struct PageState {
    mutable std::mutex              mutex;
    std::condition_variable         cv;
    std::optional<nlohmann::json>   value;
    std::exception_ptr              error;
    bool                            cancelled = false;

    // Caller holds the mutex.
    bool decided() const { return cancelled || error || value.has_value(); }
};

} // namespace detail

// ---------------------------------------------------------------------------
// PageFuture
// ---------------------------------------------------------------------------

PageFuture PageFuture::ready(nlohmann::json value) {
    PagePromise promise;
    promise.setValue(std::move(value));
    return promise.future();
}

PageFuture PageFuture::failed(std::exception_ptr error) {
    PagePromise promise;
    promise.setException(std::move(error));
    return promise.future();
}

bool PageFuture::isReady() const {
    if (!mState) return false;
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->decided();
}

bool PageFuture::isCancelled() const {
    if (!mState) return false;
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled;
}

nlohmann::json PageFuture::get() const {
    if (!mState) {
        throw std::logic_error("PageFuture::get() on an empty future");
    }

    std::unique_lock<std::mutex> lock(mState->mutex);
    mState->cv.wait(lock, [this] { return mState->decided(); });

    if (mState->cancelled) {
        throw QueryCancelledError();
    }
    if (mState->error) {
        std::rethrow_exception(mState->error);
    }
    return *mState->value;
}

void PageFuture::cancel() {
    if (!mState) return;
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        if (mState->value || mState->error) {
            return;  // too late, the outcome is already decided
        }
        mState->cancelled = true;
    }
    mState->cv.notify_all();
}

// ---------------------------------------------------------------------------
// PagePromise
// ---------------------------------------------------------------------------

PagePromise::PagePromise()
    : mState(std::make_shared<detail::PageState>()) {}

bool PagePromise::isCancelled() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled;
}

bool PagePromise::setValue(nlohmann::json value) {
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        if (mState->decided()) return false;
        mState->value = std::move(value);
    }
    mState->cv.notify_all();
    return true;
}

bool PagePromise::setException(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        if (mState->decided()) return false;
        mState->error = std::move(error);
    }
    mState->cv.notify_all();
    return true;
}

} // namespace query_stream
