#include <asyncssl/net/reactor.hpp>

#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>

#include <poll.h>
#include <spdlog/spdlog.h>

#include <asyncssl/exceptions.hpp>

namespace asyncssl {

void Reactor::registerInterest(int fd, Interest interest, Waker waker)
{
    auto& entry = interests_[fd];
    switch (interest) {
    case Interest::READ:
        entry.reader = std::move(waker);
        break;
    case Interest::WRITE:
        entry.writer = std::move(waker);
        break;
    }
}

void Reactor::deregister(int fd)
{
    interests_.erase(fd);
}

void Reactor::wait(int timeoutMs)
{
    std::vector<pollfd> fds;
    fds.reserve(interests_.size());
    for (auto const& [fd, entry] : interests_) {
        short events = 0;
        if (entry.reader) {
            events |= POLLIN;
        }
        if (entry.writer) {
            events |= POLLOUT;
        }
        fds.push_back(pollfd{fd, events, 0});
    }

    int n = 0;
    do {
        n = ::poll(fds.data(), fds.size(), timeoutMs);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw IoError{std::error_code{errno, std::system_category()}, "poll failed"};
    }
    spdlog::trace("Reactor: {} of {} descriptor(s) ready", n, fds.size());

    // collect first, waking may register new interests
    std::vector<Waker> toWake;
    for (auto const& pfd : fds) {
        if (pfd.revents == 0) {
            continue;
        }
        auto const iter = interests_.find(pfd.fd);
        if (iter == std::end(interests_)) {
            continue;
        }
        auto& entry = iter->second;
        // errors and hang-ups wake both sides so they observe the condition
        short const failure = POLLERR | POLLHUP | POLLNVAL;
        if (entry.reader && (pfd.revents & (POLLIN | failure))) {
            toWake.push_back(std::move(entry.reader));
            entry.reader = Waker{};
        }
        if (entry.writer && (pfd.revents & (POLLOUT | failure))) {
            toWake.push_back(std::move(entry.writer));
            entry.writer = Waker{};
        }
        if (!entry.reader && !entry.writer) {
            interests_.erase(iter);
        }
    }

    for (auto const& waker : toWake) {
        waker.wake();
    }
}

}  // namespace asyncssl
