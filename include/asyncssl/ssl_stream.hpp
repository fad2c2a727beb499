#ifndef ASYNCSSL_SSL_STREAM_HPP_
#define ASYNCSSL_SSL_STREAM_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>

#include <asyncssl/async_stream.hpp>
#include <asyncssl/core.hpp>
#include <asyncssl/future.hpp>
#include <asyncssl/ssl_context.hpp>

namespace asyncssl {

class SslEngine;

// TLS over any AsyncStream.
//
// Owns the SSL object and the transport. Every poll operation runs the
// OpenSSL call once with cx reachable from the transport callbacks; when
// OpenSSL wants more I/O the result is Pending and the whole operation is
// repeated on the next poll.
//
// Not thread safe. The awaitable forms borrow the stream and any buffer
// passed to them until the returned future completes.
class AsyncSslStream : public AsyncStream {
public:
    AsyncSslStream(SslPtr ssl, AsyncStreamPtr stream);
    AsyncSslStream(SslContext const& context, AsyncStreamPtr stream);
    ~AsyncSslStream() override;

    AsyncSslStream(AsyncSslStream const&) = delete;
    AsyncSslStream& operator=(AsyncSslStream const&) = delete;

    auto pollConnect(Context& cx) -> Poll<void>;
    auto pollAccept(Context& cx) -> Poll<void>;
    auto pollDoHandshake(Context& cx) -> Poll<void>;

    // SSL_read and SSL_write as they are, failures thrown as SslError.
    auto pollSslRead(Context& cx, uint8_t *data, size_t size) -> Poll<size_t>;
    auto pollSslWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>;

#ifdef ASYNCSSL_HAS_EARLY_DATA
    // Server side, before accepting. 0 means there is no more early data.
    auto pollReadEarlyData(Context& cx, uint8_t *data, size_t size) -> Poll<size_t>;
    // Client side, before connecting.
    auto pollWriteEarlyData(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>;
#endif

    auto pollRead(Context& cx, ReadBuf& buf) -> Poll<void> override;
    auto pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t> override;
    auto pollFlush(Context& cx) -> Poll<void> override;
    auto pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t> override;

    // Sends close_notify and reads until the peer's one arrives or the
    // transport ends.
    auto pollShutdown(Context& cx) -> Poll<void> override;

    auto connect() -> FuturePtr<void>;
    auto accept() -> FuturePtr<void>;
    auto doHandshake() -> FuturePtr<void>;
    auto sslRead(uint8_t *data, size_t size) -> FuturePtr<size_t>;
    auto sslWrite(uint8_t const *data, size_t size) -> FuturePtr<size_t>;

#ifdef ASYNCSSL_HAS_EARLY_DATA
    auto readEarlyData(uint8_t *data, size_t size) -> FuturePtr<size_t>;
    auto writeEarlyData(uint8_t const *data, size_t size) -> FuturePtr<size_t>;
#endif

    auto ssl() -> SSL *;
    auto ssl() const -> SSL const *;

    // The transport.
    auto getRef() const -> AsyncStream const&;
    auto getMut() -> AsyncStream&;

private:
    enum class ShutdownState {
        START,
        DRAIN_READS,
        DONE,
    };

    std::unique_ptr<SslEngine> engine_;

    template <typename F>
    auto withContext(Context& cx, F&& f);

    auto startShutdown() -> Poll<ShutdownState>;
    auto drainReads() -> Poll<ShutdownState>;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_SSL_STREAM_HPP_
