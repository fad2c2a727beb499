#ifndef ASYNCSSL_OPENSSL_ENGINE_HPP_
#define ASYNCSSL_OPENSSL_ENGINE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>

#include <asyncssl/async_stream.hpp>
#include <asyncssl/core.hpp>
#include <asyncssl/ssl_error.hpp>
#include "bridge.hpp"

namespace asyncssl {

enum class ShutdownResult {
    SENT,      // close_notify sent, the peer's not received yet
    RECEIVED,  // close_notify sent and received
};

// Blocking-style TLS stream: an SSL object reading and writing through a StreamBridge.
//
// Operations never block; where the bridge reports would-block they fail
// with WANT_READ or WANT_WRITE and must be repeated later.
class SslEngine {
public:
    SslEngine(SslPtr ssl, AsyncStreamPtr stream);

    SslEngine(SslEngine const&) = delete;
    SslEngine& operator=(SslEngine const&) = delete;

    auto ssl() -> SSL * { return ssl_.get(); }
    auto ssl() const -> SSL const * { return ssl_.get(); }
    auto bridge() -> StreamBridge& { return *bridge_; }
    auto bridge() const -> StreamBridge const& { return *bridge_; }

    // these throw SslError
    void connect();
    void accept();
    void doHandshake();
    auto sslRead(uint8_t *data, size_t size) -> size_t;
    auto sslWrite(uint8_t const *data, size_t size) -> size_t;
    auto shutdown() -> ShutdownResult;

#ifdef ASYNCSSL_HAS_EARLY_DATA
    // 0 once the early data is over
    auto readEarlyData(uint8_t *data, size_t size) -> size_t;
    auto writeEarlyData(uint8_t const *data, size_t size) -> size_t;
#endif

    // these throw IoError, would-block when the engine wants more I/O
    // 0 means end of stream, closed cleanly or not
    auto read(uint8_t *data, size_t size) -> size_t;
    auto write(uint8_t const *data, size_t size) -> size_t;
    auto writeVectored(IoSlice const *slices, size_t count) -> size_t;
    void flush();

private:
    // bridge_ outlives the SSL object, whose BIO points at it
    std::unique_ptr<StreamBridge> bridge_;
    SslPtr ssl_;

    auto makeError(int ret) -> SslError;
    void logHandshake() const;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_OPENSSL_ENGINE_HPP_
