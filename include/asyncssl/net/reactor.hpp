#ifndef ASYNCSSL_NET_REACTOR_HPP_
#define ASYNCSSL_NET_REACTOR_HPP_

#include <map>

#include <asyncssl/context.hpp>

namespace asyncssl {

// Readiness notifications for non-blocking file descriptors, based on poll(2).
//
// Interest is one-shot: a registered waker fires once, then must be
// registered again by the next Pending result.
class Reactor {
public:
    enum class Interest { READ, WRITE };

    void registerInterest(int fd, Interest interest, Waker waker);
    void deregister(int fd);

    bool hasInterest() const { return !interests_.empty(); }

    // Blocks until at least one registered descriptor is ready, waking its tasks.
    // A negative timeout waits forever.
    void wait(int timeoutMs = -1);

private:
    struct Entry {
        Waker reader;
        Waker writer;
    };

    std::map<int, Entry> interests_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_NET_REACTOR_HPP_
