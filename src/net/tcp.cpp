#include <asyncssl/net/tcp.hpp>

#include <algorithm>
#include <cerrno>
#include <system_error>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <asyncssl/exceptions.hpp>

namespace asyncssl {

namespace {

struct AddrInfoDeleter { void operator()(addrinfo *info) { freeaddrinfo(info); } };
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

constexpr size_t MAX_IOV = 64;

auto lastError(char const *what) -> IoError
{
    return IoError{std::error_code{errno, std::system_category()}, what};
}

bool wouldBlock(int err)
{
    return err == EAGAIN || err == EWOULDBLOCK;
}

auto resolve(std::string const& host, std::string const& port, bool passive) -> AddrInfoPtr
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) {
        hints.ai_flags = AI_PASSIVE;
    }

    addrinfo *result = nullptr;
    if (auto const err = getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &result); err != 0) {
        throw IoError{std::make_error_code(std::errc::host_unreachable),
                      "getaddrinfo " + host + ":" + port + ": " + gai_strerror(err)};
    }
    return AddrInfoPtr{result};
}

}  // namespace

auto TcpStream::open(Reactor& reactor, std::string const& host, std::string const& port)
    -> std::unique_ptr<TcpStream>
{
    auto const addresses = resolve(host, port, false);

    std::error_code lastErrorCode = std::make_error_code(std::errc::host_unreachable);
    for (auto *ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int const fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            lastErrorCode = std::error_code{errno, std::system_category()};
            continue;
        }

        int const one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            spdlog::debug("Connected to {}:{}", host, port);
            return std::make_unique<TcpStream>(reactor, fd, false);
        }
        if (errno == EINPROGRESS) {
            spdlog::debug("Connecting to {}:{}", host, port);
            return std::make_unique<TcpStream>(reactor, fd, true);
        }

        lastErrorCode = std::error_code{errno, std::system_category()};
        ::close(fd);
    }

    throw IoError{lastErrorCode, "can't connect to " + host + ":" + port};
}

TcpStream::TcpStream(Reactor& reactor, int fd, bool connecting)
    : reactor_{reactor}, fd_{fd}, connecting_{connecting}
{
}

TcpStream::~TcpStream()
{
    reactor_.deregister(fd_);
    ::close(fd_);
}

auto TcpStream::pollConnected(Context& cx) -> Poll<void>
{
    if (!connecting_) {
        return ready();
    }

    pollfd pfd{fd_, POLLOUT, 0};
    int const n = ::poll(&pfd, 1, 0);
    if (n < 0) {
        throw lastError("poll");
    }
    if (n == 0) {
        reactor_.registerInterest(fd_, Reactor::Interest::WRITE, cx.waker());
        return Pending{};
    }

    int error = 0;
    socklen_t length = sizeof(error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &length) < 0) {
        throw lastError("getsockopt");
    }
    if (error != 0) {
        throw IoError{std::error_code{error, std::system_category()}, "connect failed"};
    }

    connecting_ = false;
    return ready();
}

auto TcpStream::connected() -> FuturePtr<void>
{
    return pollFn<void>([this](Context& cx) { return this->pollConnected(cx); });
}

auto TcpStream::pollRead(Context& cx, ReadBuf& buf) -> Poll<void>
{
    while (true) {
        auto const n = ::recv(fd_, buf.unfilled(), buf.remaining(), 0);
        if (n >= 0) {
            buf.assumeInit(n);
            buf.advance(n);
            return ready();
        }
        if (errno == EINTR) {
            continue;
        }
        if (wouldBlock(errno)) {
            reactor_.registerInterest(fd_, Reactor::Interest::READ, cx.waker());
            return Pending{};
        }
        throw lastError("recv");
    }
}

auto TcpStream::pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>
{
    while (true) {
        auto const n = ::send(fd_, data, size, MSG_NOSIGNAL);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (wouldBlock(errno)) {
            reactor_.registerInterest(fd_, Reactor::Interest::WRITE, cx.waker());
            return Pending{};
        }
        throw lastError("send");
    }
}

auto TcpStream::pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t>
{
    iovec iov[MAX_IOV];
    size_t const n = std::min(count, MAX_IOV);
    for (size_t i = 0; i < n; i++) {
        iov[i].iov_base = const_cast<uint8_t *>(slices[i].data);
        iov[i].iov_len = slices[i].size;
    }

    msghdr msg{};
    msg.msg_iov = iov;
    msg.msg_iovlen = n;

    while (true) {
        auto const written = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (written >= 0) {
            return static_cast<size_t>(written);
        }
        if (errno == EINTR) {
            continue;
        }
        if (wouldBlock(errno)) {
            reactor_.registerInterest(fd_, Reactor::Interest::WRITE, cx.waker());
            return Pending{};
        }
        throw lastError("sendmsg");
    }
}

auto TcpStream::pollFlush(Context&) -> Poll<void>
{
    return ready();
}

auto TcpStream::pollShutdown(Context&) -> Poll<void>
{
    if (::shutdown(fd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        throw lastError("shutdown");
    }
    return ready();
}

TcpListener::TcpListener(Reactor& reactor, std::string const& host, std::string const& port)
    : reactor_{reactor}, fd_{-1}
{
    auto const addresses = resolve(host, port, true);
    auto const *ai = addresses.get();

    fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd_ < 0) {
        throw lastError("socket");
    }

    int const one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd_, ai->ai_addr, ai->ai_addrlen) < 0 || ::listen(fd_, SOMAXCONN) < 0) {
        auto const error = lastError("bind");
        ::close(fd_);
        throw error;
    }
    spdlog::debug("Listening on {}:{}", host, this->localPort());
}

TcpListener::~TcpListener()
{
    reactor_.deregister(fd_);
    ::close(fd_);
}

auto TcpListener::localPort() const -> uint16_t
{
    sockaddr_storage address{};
    socklen_t length = sizeof(address);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&address), &length) < 0) {
        throw lastError("getsockname");
    }
    if (address.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6 const&>(address).sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in const&>(address).sin_port);
}

auto TcpListener::pollAccept(Context& cx) -> Poll<std::unique_ptr<TcpStream>>
{
    while (true) {
        int const fd = ::accept4(fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd >= 0) {
            int const one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            return std::make_unique<TcpStream>(reactor_, fd);
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (wouldBlock(errno)) {
            reactor_.registerInterest(fd_, Reactor::Interest::READ, cx.waker());
            return Pending{};
        }
        throw lastError("accept");
    }
}

}  // namespace asyncssl
