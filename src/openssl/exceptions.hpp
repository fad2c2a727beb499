#ifndef ASYNCSSL_OPENSSL_EXCEPTIONS_HPP_
#define ASYNCSSL_OPENSSL_EXCEPTIONS_HPP_

#include <string>

namespace asyncssl {

// Drains the thread's OpenSSL error queue into a readable string, empty if none.
auto takeErrorQueue() -> std::string;

}  // namespace asyncssl

#endif  // ASYNCSSL_OPENSSL_EXCEPTIONS_HPP_
