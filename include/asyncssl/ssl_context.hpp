#ifndef ASYNCSSL_SSL_CONTEXT_HPP_
#define ASYNCSSL_SSL_CONTEXT_HPP_

#include <asyncssl/core.hpp>
#include <asyncssl/tls_config.hpp>

namespace asyncssl {

// Shared TLS configuration, the OpenSSL SSL_CTX built from a TlsConfig.
//
// Throws ConfigError when a certificate, key or CA can't be loaded.
class SslContext {
public:
    explicit SslContext(TlsConfig config);

    auto config() const -> TlsConfig const& { return config_; }
    auto native() const -> SSL_CTX * { return ctx_.get(); }

    // Creates the engine object for one connection, with SNI and host
    // name verification configured for clients.
    auto newSsl() const -> SslPtr;

private:
    TlsConfig config_;
    SslCtxPtr ctx_;

    void loadVerifyLocations();
    void loadIdentity();
};

}  // namespace asyncssl

#endif  // ASYNCSSL_SSL_CONTEXT_HPP_
