#ifndef ASYNCSSL_CONTEXT_HPP_
#define ASYNCSSL_CONTEXT_HPP_

#include <functional>
#include <utility>

namespace asyncssl {

// Handle used to reschedule the task that received Pending.
class Waker {
public:
    Waker() = default;

    explicit Waker(std::function<void()> wake)
        : wake_{std::move(wake)}
    {
    }

    void wake() const
    {
        if (wake_) {
            wake_();
        }
    }

    explicit operator bool() const { return bool{wake_}; }

private:
    std::function<void()> wake_;
};

// Per-poll context handed down through every poll call.
//
// Only valid for the duration of the poll call it is passed to.
class Context {
public:
    explicit Context(Waker const& waker)
        : waker_{waker}
    {
    }

    Context(Context const&) = delete;
    Context& operator=(Context const&) = delete;

    auto waker() const -> Waker const& { return waker_; }

private:
    Waker const& waker_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_CONTEXT_HPP_
