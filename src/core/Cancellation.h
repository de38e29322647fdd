#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace link_scope {

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

// Read side handed to workers. A default constructed token is never cancelled.
class CancellationToken {
    struct State {
        std::atomic<bool> requested{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
    explicit CancellationToken(std::shared_ptr<State> s) : state_(std::move(s)) {}

public:
    CancellationToken() = default;

    bool is_cancellation_requested() const {
        return state_ && state_->requested.load(std::memory_order_acquire);
    }

    void throw_if_cancellation_requested() const {
        if(is_cancellation_requested()) throw OperationCancelled();
    }

    // Sleeps for up to `d`; returns true if woken by cancellation.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        if(!state_) { std::this_thread::sleep_for(d); return false; }
        std::unique_lock<std::mutex> lk(state_->mutex);
        return state_->cv.wait_for(lk, d, [this]{ return state_->requested.load(std::memory_order_acquire); });
    }

    friend class CancellationSource;
};

// Owner side, held by whoever controls the operation's lifetime.
class CancellationSource {
public:
    CancellationSource() { reset(); }

    void cancel() {
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            state_->requested.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    CancellationToken token() const { return CancellationToken(state_); }

    void reset() { state_ = std::make_shared<CancellationToken::State>(); }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

}
