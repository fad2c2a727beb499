#include <asyncssl/ssl_stream.hpp>

#include <array>
#include <system_error>

#include <spdlog/spdlog.h>

#include "classify.hpp"
#include "openssl/bridge.hpp"
#include "openssl/engine.hpp"

namespace asyncssl {

namespace {

constexpr size_t DRAIN_BUFFER_SIZE = 1024;

// The peer closed the transport without close_notify.
bool isBenignClose(SslError const& e)
{
    return e.code() == SslErrorCode::SYSCALL && e.ioError() == nullptr;
}

}  // namespace

AsyncSslStream::AsyncSslStream(SslPtr ssl, AsyncStreamPtr stream)
    : engine_{std::make_unique<SslEngine>(std::move(ssl), std::move(stream))}
{
}

AsyncSslStream::AsyncSslStream(SslContext const& context, AsyncStreamPtr stream)
    : AsyncSslStream{context.newSsl(), std::move(stream)}
{
}

AsyncSslStream::~AsyncSslStream() = default;

template <typename F>
auto AsyncSslStream::withContext(Context& cx, F&& f)
{
    ContextScope scope{engine_->bridge(), cx};
    return std::forward<F>(f)(*engine_);
}

auto AsyncSslStream::pollConnect(Context& cx) -> Poll<void>
{
    return this->withContext(cx, [](SslEngine& engine) {
        return cvtSsl([&] { engine.connect(); });
    });
}

auto AsyncSslStream::pollAccept(Context& cx) -> Poll<void>
{
    return this->withContext(cx, [](SslEngine& engine) {
        return cvtSsl([&] { engine.accept(); });
    });
}

auto AsyncSslStream::pollDoHandshake(Context& cx) -> Poll<void>
{
    return this->withContext(cx, [](SslEngine& engine) {
        return cvtSsl([&] { engine.doHandshake(); });
    });
}

auto AsyncSslStream::pollSslRead(Context& cx, uint8_t *data, size_t size) -> Poll<size_t>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtSsl([&] { return engine.sslRead(data, size); });
    });
}

auto AsyncSslStream::pollSslWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtSsl([&] { return engine.sslWrite(data, size); });
    });
}

#ifdef ASYNCSSL_HAS_EARLY_DATA
auto AsyncSslStream::pollReadEarlyData(Context& cx, uint8_t *data, size_t size) -> Poll<size_t>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtSsl([&] { return engine.readEarlyData(data, size); });
    });
}

auto AsyncSslStream::pollWriteEarlyData(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtSsl([&] { return engine.writeEarlyData(data, size); });
    });
}
#endif

auto AsyncSslStream::pollRead(Context& cx, ReadBuf& buf) -> Poll<void>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtIo([&] {
            // OpenSSL only writes to the region, it may be left uninitialized
            size_t const n = engine.read(buf.unfilled(), buf.remaining());
            buf.assumeInit(n);
            buf.advance(n);
        });
    });
}

auto AsyncSslStream::pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtIo([&] { return engine.write(data, size); });
    });
}

auto AsyncSslStream::pollFlush(Context& cx) -> Poll<void>
{
    return this->withContext(cx, [](SslEngine& engine) {
        return cvtIo([&] { engine.flush(); });
    });
}

auto AsyncSslStream::pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t>
{
    return this->withContext(cx, [&](SslEngine& engine) {
        return cvtIo([&] { return engine.writeVectored(slices, count); });
    });
}

auto AsyncSslStream::startShutdown() -> Poll<ShutdownState>
{
    try {
        switch (engine_->shutdown()) {
        case ShutdownResult::SENT:
            spdlog::debug("close_notify sent, waiting for the peer");
            return ShutdownState::DRAIN_READS;
        case ShutdownResult::RECEIVED:
            spdlog::debug("close_notify exchanged");
            return ShutdownState::DONE;
        }
    }
    catch (SslError const& e) {
        if (e.code() == SslErrorCode::ZERO_RETURN) {
            return ShutdownState::DONE;
        }
        if (isWantIo(e)) {
            return Pending{};
        }
        if (isBenignClose(e)) {
            spdlog::warn("Transport closed before close_notify exchange, shutdown considered complete");
            return ShutdownState::DONE;
        }
        throw e.intoIoError();
    }
    throw IoError{std::make_error_code(std::errc::io_error), "unknown SSL_shutdown result"};
}

auto AsyncSslStream::drainReads() -> Poll<ShutdownState>
{
    std::array<uint8_t, DRAIN_BUFFER_SIZE> scratch;
    while (true) {
        try {
            // whatever the peer still sends is dropped
            engine_->sslRead(scratch.data(), scratch.size());
        }
        catch (SslError const& e) {
            if (e.code() == SslErrorCode::ZERO_RETURN) {
                spdlog::debug("close_notify received");
                return ShutdownState::DONE;
            }
            if (isWantIo(e)) {
                return Pending{};
            }
            if (isBenignClose(e)) {
                spdlog::warn("Transport closed while waiting for close_notify, shutdown considered complete");
                return ShutdownState::DONE;
            }
            throw e.intoIoError();
        }
    }
}

auto AsyncSslStream::pollShutdown(Context& cx) -> Poll<void>
{
    return this->withContext(cx, [this](SslEngine&) -> Poll<void> {
        auto state = ShutdownState::START;
        auto step = this->startShutdown();
        if (step.isPending()) {
            return Pending{};
        }
        state = step.value();

        if (state == ShutdownState::DRAIN_READS) {
            step = this->drainReads();
            if (step.isPending()) {
                return Pending{};
            }
            state = step.value();
        }

        if (state != ShutdownState::DONE) {
            throw IoError{std::make_error_code(std::errc::state_not_recoverable),
                          "shutdown drain ended in an unexpected state"};
        }
        return ready();
    });
}

auto AsyncSslStream::connect() -> FuturePtr<void>
{
    return pollFn<void>([this](Context& cx) { return this->pollConnect(cx); });
}

auto AsyncSslStream::accept() -> FuturePtr<void>
{
    return pollFn<void>([this](Context& cx) { return this->pollAccept(cx); });
}

auto AsyncSslStream::doHandshake() -> FuturePtr<void>
{
    return pollFn<void>([this](Context& cx) { return this->pollDoHandshake(cx); });
}

auto AsyncSslStream::sslRead(uint8_t *data, size_t size) -> FuturePtr<size_t>
{
    return pollFn<size_t>([this, data, size](Context& cx) { return this->pollSslRead(cx, data, size); });
}

auto AsyncSslStream::sslWrite(uint8_t const *data, size_t size) -> FuturePtr<size_t>
{
    return pollFn<size_t>([this, data, size](Context& cx) { return this->pollSslWrite(cx, data, size); });
}

#ifdef ASYNCSSL_HAS_EARLY_DATA
auto AsyncSslStream::readEarlyData(uint8_t *data, size_t size) -> FuturePtr<size_t>
{
    return pollFn<size_t>([this, data, size](Context& cx) { return this->pollReadEarlyData(cx, data, size); });
}

auto AsyncSslStream::writeEarlyData(uint8_t const *data, size_t size) -> FuturePtr<size_t>
{
    return pollFn<size_t>([this, data, size](Context& cx) { return this->pollWriteEarlyData(cx, data, size); });
}
#endif

auto AsyncSslStream::ssl() -> SSL *
{
    return engine_->ssl();
}

auto AsyncSslStream::ssl() const -> SSL const *
{
    return engine_->ssl();
}

auto AsyncSslStream::getRef() const -> AsyncStream const&
{
    return engine_->bridge().stream();
}

auto AsyncSslStream::getMut() -> AsyncStream&
{
    return engine_->bridge().stream();
}

}  // namespace asyncssl
