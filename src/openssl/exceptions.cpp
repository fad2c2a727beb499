#include "exceptions.hpp"

#include <array>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/ssl_error.hpp>

namespace asyncssl {

namespace {

auto describe(SslErrorCode code, std::string const& details, std::optional<IoError> const& ioError) -> std::string
{
    std::string message = toString(code);
    if (!details.empty()) {
        message += ": " + details;
    }
    if (ioError) {
        message += std::string{" ("} + ioError->what() + ")";
    }
    return message;
}

}  // namespace

auto takeErrorQueue() -> std::string
{
    std::string result;
    std::array<char, 256> buffer;
    while (auto const error = ERR_get_error()) {
        ERR_error_string_n(error, buffer.data(), buffer.size());
        if (!result.empty()) {
            result += "; ";
        }
        result += buffer.data();
    }
    return result;
}

ConfigError::ConfigError(char const *message)
    : ConfigError{std::string{message}}
{
}

ConfigError::ConfigError(std::string const& message)
    : AsyncSslException{[&message] {
        auto const queue = takeErrorQueue();
        return queue.empty() ? message : message + ": " + queue;
    }()}
{
    spdlog::debug("ConfigError: {}", this->what());
}

auto toString(SslErrorCode code) -> char const *
{
    switch (code) {
    case SslErrorCode::NONE:
        return "no error";
    case SslErrorCode::SSL:
        return "TLS protocol error";
    case SslErrorCode::WANT_READ:
        return "the operation needs to read more data";
    case SslErrorCode::WANT_WRITE:
        return "the operation needs to write more data";
    case SslErrorCode::WANT_X509_LOOKUP:
        return "the operation needs a certificate lookup";
    case SslErrorCode::SYSCALL:
        return "transport level failure";
    case SslErrorCode::ZERO_RETURN:
        return "the TLS session was closed";
    case SslErrorCode::WANT_CONNECT:
        return "the operation needs to connect";
    case SslErrorCode::WANT_ACCEPT:
        return "the operation needs to accept";
    case SslErrorCode::OTHER:
        break;
    }
    return "unknown TLS engine error";
}

SslError::SslError(SslErrorCode code, std::string const& details, std::optional<IoError> ioError)
    : AsyncSslException{describe(code, details, ioError)}
    , code_{code}, details_{details}, ioError_{std::move(ioError)}
{
}

auto SslError::intoIoError() const -> IoError
{
    if (ioError_) {
        return *ioError_;
    }
    return IoError{std::make_error_code(std::errc::io_error), this->what()};
}

}  // namespace asyncssl
