#ifndef ASYNCSSL_EXCEPTIONS_HPP_
#define ASYNCSSL_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>
#include <system_error>

namespace asyncssl {

class AsyncSslException : public std::runtime_error {
public:
    AsyncSslException(char const *message)
        : std::runtime_error{message}
    {
    }

    AsyncSslException(std::string const& message)
        : std::runtime_error{message}
    {
    }
};

// Transport level failure, or a would-block signal when code() is operation_would_block.
class IoError : public AsyncSslException {
public:
    explicit IoError(std::error_code code)
        : AsyncSslException{code.message()}, code_{code}
    {
    }

    IoError(std::error_code code, std::string const& message)
        : AsyncSslException{message}, code_{code}
    {
    }

    auto code() const -> std::error_code { return code_; }

    bool isWouldBlock() const
    {
        return code_ == std::errc::operation_would_block
            || code_ == std::errc::resource_unavailable_try_again;
    }

    static auto wouldBlock() -> IoError
    {
        return IoError{std::make_error_code(std::errc::operation_would_block)};
    }

private:
    std::error_code code_;
};

class EndOfStreamError : public IoError {
public:
    EndOfStreamError()
        : IoError{std::make_error_code(std::errc::io_error), "end of stream reached"}
    {
    }
};

class ConfigError : public AsyncSslException {
public:
    explicit ConfigError(char const *message);
    explicit ConfigError(std::string const& message);
};

}  // namespace asyncssl

#endif  // ASYNCSSL_EXCEPTIONS_HPP_
