#ifndef ASYNCSSL_SSL_ERROR_HPP_
#define ASYNCSSL_SSL_ERROR_HPP_

#include <optional>
#include <string>

#include <asyncssl/exceptions.hpp>

namespace asyncssl {

// Mirrors the values returned by SSL_get_error.
enum class SslErrorCode {
    NONE,
    SSL,
    WANT_READ,
    WANT_WRITE,
    WANT_X509_LOOKUP,
    SYSCALL,
    ZERO_RETURN,
    WANT_CONNECT,
    WANT_ACCEPT,
    OTHER,
};

auto toString(SslErrorCode code) -> char const *;

// An error reported by the TLS engine.
//
// ioError() holds the transport failure that caused it, if any. Would-block
// signals from the transport are attached to WANT_READ and WANT_WRITE errors.
class SslError : public AsyncSslException {
public:
    SslError(SslErrorCode code, std::string const& details, std::optional<IoError> ioError);

    auto code() const -> SslErrorCode { return code_; }
    auto details() const -> std::string const& { return details_; }
    auto ioError() const -> IoError const * { return ioError_ ? &*ioError_ : nullptr; }

    // The attached transport error, or a generic io_error describing this one.
    auto intoIoError() const -> IoError;

private:
    SslErrorCode code_;
    std::string details_;
    std::optional<IoError> ioError_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_SSL_ERROR_HPP_
