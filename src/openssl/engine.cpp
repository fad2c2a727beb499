#include "engine.hpp"

#include <algorithm>
#include <cassert>
#include <climits>

#include <openssl/err.h>
#include <spdlog/spdlog.h>

#include "exceptions.hpp"

namespace asyncssl {

namespace {

auto toErrorCode(int error) -> SslErrorCode
{
    switch (error) {
    case SSL_ERROR_NONE:
        return SslErrorCode::NONE;
    case SSL_ERROR_SSL:
        return SslErrorCode::SSL;
    case SSL_ERROR_WANT_READ:
        return SslErrorCode::WANT_READ;
    case SSL_ERROR_WANT_WRITE:
        return SslErrorCode::WANT_WRITE;
    case SSL_ERROR_WANT_X509_LOOKUP:
        return SslErrorCode::WANT_X509_LOOKUP;
    case SSL_ERROR_SYSCALL:
        return SslErrorCode::SYSCALL;
    case SSL_ERROR_ZERO_RETURN:
        return SslErrorCode::ZERO_RETURN;
    case SSL_ERROR_WANT_CONNECT:
        return SslErrorCode::WANT_CONNECT;
    case SSL_ERROR_WANT_ACCEPT:
        return SslErrorCode::WANT_ACCEPT;
    default:
        return SslErrorCode::OTHER;
    }
}

auto clampSize(size_t size) -> int
{
    return static_cast<int>(std::min<size_t>(size, INT_MAX));
}

}  // namespace

SslEngine::SslEngine(SslPtr ssl, AsyncStreamPtr stream)
    : bridge_{std::make_unique<StreamBridge>(std::move(stream))}
    , ssl_{std::move(ssl)}
{
    assert(ssl_);

    // the SSL object takes ownership of the BIO
    BIO *bio = bridge_->createBio();
    SSL_set_bio(ssl_.get(), bio, bio);
}

auto SslEngine::makeError(int ret) -> SslError
{
    auto code = toErrorCode(SSL_get_error(ssl_.get(), ret));
    auto ioError = bridge_->takeError();
    auto details = takeErrorQueue();

    switch (code) {
    case SslErrorCode::WANT_READ:
    case SslErrorCode::WANT_WRITE:
        break;
    case SslErrorCode::SYSCALL:
        // errors from the engine itself take precedence
        if (!details.empty()) {
            ioError.reset();
        }
        break;
    default:
        ioError.reset();
        break;
    }

    return SslError{code, details, std::move(ioError)};
}

void SslEngine::logHandshake() const
{
    spdlog::debug("TLS handshake complete: {} {}", SSL_get_version(ssl_.get()), SSL_get_cipher_name(ssl_.get()));
}

void SslEngine::connect()
{
    ERR_clear_error();
    if (int const ret = SSL_connect(ssl_.get()); ret < 1) {
        throw this->makeError(ret);
    }
    this->logHandshake();
}

void SslEngine::accept()
{
    ERR_clear_error();
    if (int const ret = SSL_accept(ssl_.get()); ret < 1) {
        throw this->makeError(ret);
    }
    this->logHandshake();
}

void SslEngine::doHandshake()
{
    ERR_clear_error();
    if (int const ret = SSL_do_handshake(ssl_.get()); ret < 1) {
        throw this->makeError(ret);
    }
    this->logHandshake();
}

auto SslEngine::sslRead(uint8_t *data, size_t size) -> size_t
{
    if (size == 0) {
        return 0;
    }

    ERR_clear_error();
    int const ret = SSL_read(ssl_.get(), data, clampSize(size));
    if (ret < 1) {
        throw this->makeError(ret);
    }
    return static_cast<size_t>(ret);
}

auto SslEngine::sslWrite(uint8_t const *data, size_t size) -> size_t
{
    if (size == 0) {
        return 0;
    }

    ERR_clear_error();
    int const ret = SSL_write(ssl_.get(), data, clampSize(size));
    if (ret < 1) {
        throw this->makeError(ret);
    }
    return static_cast<size_t>(ret);
}

auto SslEngine::shutdown() -> ShutdownResult
{
    ERR_clear_error();
    switch (int const ret = SSL_shutdown(ssl_.get())) {
    case 0:
        return ShutdownResult::SENT;
    case 1:
        return ShutdownResult::RECEIVED;
    default:
        throw this->makeError(ret);
    }
}

#ifdef ASYNCSSL_HAS_EARLY_DATA
auto SslEngine::readEarlyData(uint8_t *data, size_t size) -> size_t
{
    ERR_clear_error();
    size_t read = 0;
    switch (int const ret = SSL_read_early_data(ssl_.get(), data, size, &read)) {
    case SSL_READ_EARLY_DATA_SUCCESS:
        return read;
    case SSL_READ_EARLY_DATA_FINISH:
        return 0;
    default:
        throw this->makeError(ret);
    }
}

auto SslEngine::writeEarlyData(uint8_t const *data, size_t size) -> size_t
{
    ERR_clear_error();
    size_t written = 0;
    if (int const ret = SSL_write_early_data(ssl_.get(), data, size, &written); ret < 1) {
        throw this->makeError(ret);
    }
    return written;
}
#endif

auto SslEngine::read(uint8_t *data, size_t size) -> size_t
{
    while (true) {
        try {
            return this->sslRead(data, size);
        }
        catch (SslError const& e) {
            switch (e.code()) {
            case SslErrorCode::ZERO_RETURN:
                return 0;
            case SslErrorCode::SYSCALL:
                if (e.ioError() == nullptr) {
                    return 0;
                }
                break;
            case SslErrorCode::WANT_READ:
                // a non-application record was consumed, try again
                if (e.ioError() == nullptr) {
                    continue;
                }
                break;
            default:
                break;
            }
            throw e.intoIoError();
        }
    }
}

auto SslEngine::write(uint8_t const *data, size_t size) -> size_t
{
    while (true) {
        try {
            return this->sslWrite(data, size);
        }
        catch (SslError const& e) {
            if (e.code() == SslErrorCode::WANT_READ && e.ioError() == nullptr) {
                continue;
            }
            throw e.intoIoError();
        }
    }
}

auto SslEngine::writeVectored(IoSlice const *slices, size_t count) -> size_t
{
    for (size_t i = 0; i < count; i++) {
        if (slices[i].size > 0) {
            return this->write(slices[i].data, slices[i].size);
        }
    }
    return 0;
}

void SslEngine::flush()
{
    bridge_->flush();
}

}  // namespace asyncssl
