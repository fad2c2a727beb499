#ifndef ASYNCSSL_POLL_HPP_
#define ASYNCSSL_POLL_HPP_

#include <cassert>
#include <optional>
#include <utility>

namespace asyncssl {

struct Pending {};

// Outcome of one poll: either ready with a value or pending.
//
// A pending result promises that the waker of the polling Context has been
// registered with whatever will make progress possible. Failures are thrown.
template <typename T>
class Poll {
public:
    Poll(Pending) {}
    Poll(T value) : value_{std::move(value)} {}

    bool isReady() const { return value_.has_value(); }
    bool isPending() const { return !value_.has_value(); }

    auto value() -> T& { assert(value_); return *value_; }
    auto value() const -> T const& { assert(value_); return *value_; }

private:
    std::optional<T> value_;
};

template <>
class Poll<void> {
public:
    Poll(Pending) : ready_{false} {}
    Poll() : ready_{true} {}

    bool isReady() const { return ready_; }
    bool isPending() const { return !ready_; }

private:
    bool ready_;
};

inline auto ready() -> Poll<void> { return Poll<void>{}; }

}  // namespace asyncssl

#endif  // ASYNCSSL_POLL_HPP_
