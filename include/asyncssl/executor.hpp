#ifndef ASYNCSSL_EXECUTOR_HPP_
#define ASYNCSSL_EXECUTOR_HPP_

#include <cstddef>
#include <memory>

#include <asyncssl/future.hpp>

namespace asyncssl {

class Reactor;

// Single-threaded executor polling spawned tasks whenever they are woken.
//
// Without a reactor, a state where tasks remain but none was woken is
// reported as an AsyncSslException rather than waiting forever.
class LocalExecutor {
public:
    // not owning
    explicit LocalExecutor(Reactor *reactor = nullptr);
    ~LocalExecutor();

    LocalExecutor(LocalExecutor const&) = delete;
    LocalExecutor& operator=(LocalExecutor const&) = delete;

    void spawn(FuturePtr<void> task);

    // Polls until every spawned task completed. A task failure propagates.
    void run();

    auto pendingTasks() const -> size_t;

private:
    struct State;

    std::shared_ptr<State> state_;
    Reactor *reactor_;

    auto makeWaker(size_t id) const -> Waker;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_EXECUTOR_HPP_
