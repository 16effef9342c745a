#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>

namespace shopping_assistance {

// Shared cancel flag for one request. Copies observe the same state.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : state_(std::make_shared<State>()) {}

    static CancellationToken with_deadline(std::chrono::milliseconds budget) {
        CancellationToken token;
        token.state_->deadline = Clock::now() + budget;
        return token;
    }

    void cancel() const { state_->cancelled.store(true); }

    bool is_cancelled() const {
        if (state_->cancelled.load()) return true;
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
    };
    std::shared_ptr<State> state_;
};

enum class WaitStatus { Ready, TimedOut, Cancelled };

// Waits in short slices so a cancel is noticed within one slice.
template <typename T>
WaitStatus wait_for_result(std::future<T>& fut,
                           CancellationToken::Clock::time_point deadline,
                           const CancellationToken& token) {
    constexpr auto slice = std::chrono::milliseconds(25);
    for (;;) {
        if (token.is_cancelled()) return WaitStatus::Cancelled;
        auto now = CancellationToken::Clock::now();
        if (now >= deadline) {
            return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready
                ? WaitStatus::Ready : WaitStatus::TimedOut;
        }
        auto step = std::min<CancellationToken::Clock::duration>(slice, deadline - now);
        if (fut.wait_for(step) == std::future_status::ready) return WaitStatus::Ready;
    }
}

} // namespace shopping_assistance
