#ifndef ASYNCSSL_CLASSIFY_HPP_
#define ASYNCSSL_CLASSIFY_HPP_

#include <type_traits>
#include <utility>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/poll.hpp>
#include <asyncssl/ssl_error.hpp>

namespace asyncssl {

// Runs f, turning a would-block IoError into Pending.
// Any other exception propagates as a ready failure.
template <typename F>
auto cvtIo(F&& f) -> Poll<std::invoke_result_t<F>>
{
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
            std::forward<F>(f)();
            return ready();
        } else {
            return std::forward<F>(f)();
        }
    }
    catch (IoError const& e) {
        if (e.isWouldBlock()) {
            return Pending{};
        }
        throw;
    }
}

inline bool isWantIo(SslError const& e)
{
    return e.code() == SslErrorCode::WANT_READ || e.code() == SslErrorCode::WANT_WRITE;
}

// Runs f, turning an SslError asking for more input or output into Pending.
// Any other exception propagates as a ready failure.
template <typename F>
auto cvtSsl(F&& f) -> Poll<std::invoke_result_t<F>>
{
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
            std::forward<F>(f)();
            return ready();
        } else {
            return std::forward<F>(f)();
        }
    }
    catch (SslError const& e) {
        if (isWantIo(e)) {
            return Pending{};
        }
        throw;
    }
}

}  // namespace asyncssl

#endif  // ASYNCSSL_CLASSIFY_HPP_
