#ifndef ASYNCSSL_FUTURE_HPP_
#define ASYNCSSL_FUTURE_HPP_

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <asyncssl/context.hpp>
#include <asyncssl/poll.hpp>

namespace asyncssl {

// A computation driven to completion by repeated polls.
//
// Must not be polled again once it returned a ready result.
template <typename T>
class Future {
public:
    virtual ~Future() = default;

    virtual auto poll(Context& cx) -> Poll<T> = 0;
};

template <typename T>
using FuturePtr = std::unique_ptr<Future<T>>;

template <typename T, typename F>
class PollFn : public Future<T> {
public:
    explicit PollFn(F f)
        : f_{std::move(f)}
    {
    }

    auto poll(Context& cx) -> Poll<T> override { return f_(cx); }

private:
    F f_;
};

// Wraps a callable taking Context& and returning Poll<T>.
template <typename T, typename F>
auto pollFn(F f) -> FuturePtr<T>
{
    return std::make_unique<PollFn<T, F>>(std::move(f));
}

using Step = std::function<FuturePtr<void>()>;

// Runs the futures built by steps one after another.
//
// Each step is only invoked once the previous future completed, so a step
// may depend on state produced by earlier ones.
class Sequence : public Future<void> {
public:
    explicit Sequence(std::vector<Step> steps);

    auto poll(Context& cx) -> Poll<void> override;

private:
    std::vector<Step> steps_;
    size_t next_;
    FuturePtr<void> current_;
};

auto sequence(std::vector<Step> steps) -> FuturePtr<void>;

}  // namespace asyncssl

#endif  // ASYNCSSL_FUTURE_HPP_
