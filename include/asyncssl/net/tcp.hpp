#ifndef ASYNCSSL_NET_TCP_HPP_
#define ASYNCSSL_NET_TCP_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include <asyncssl/async_stream.hpp>
#include <asyncssl/future.hpp>
#include <asyncssl/net/reactor.hpp>

namespace asyncssl {

class TcpStream : public AsyncStream {
public:
    // Starts a non-blocking connect. Poll connected() before any I/O.
    // Name resolution itself is synchronous.
    static auto open(Reactor& reactor, std::string const& host, std::string const& port)
        -> std::unique_ptr<TcpStream>;

    // Takes ownership of a connected non-blocking socket.
    TcpStream(Reactor& reactor, int fd, bool connecting = false);
    ~TcpStream() override;

    TcpStream(TcpStream const&) = delete;
    TcpStream& operator=(TcpStream const&) = delete;

    auto pollConnected(Context& cx) -> Poll<void>;
    auto connected() -> FuturePtr<void>;

    auto pollRead(Context& cx, ReadBuf& buf) -> Poll<void> override;
    auto pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t> override;
    auto pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t> override;
    auto pollFlush(Context& cx) -> Poll<void> override;
    auto pollShutdown(Context& cx) -> Poll<void> override;

    bool isWriteVectored() const override { return true; }

    auto fd() const -> int { return fd_; }

private:
    Reactor& reactor_;
    int fd_;
    bool connecting_;
};

class TcpListener {
public:
    // Use port "0" for an ephemeral port.
    TcpListener(Reactor& reactor, std::string const& host, std::string const& port);
    ~TcpListener();

    TcpListener(TcpListener const&) = delete;
    TcpListener& operator=(TcpListener const&) = delete;

    auto localPort() const -> uint16_t;

    auto pollAccept(Context& cx) -> Poll<std::unique_ptr<TcpStream>>;

private:
    Reactor& reactor_;
    int fd_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_NET_TCP_HPP_
