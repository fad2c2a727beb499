#include <asyncssl/ssl_context.hpp>

#include <cassert>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

#include <asyncssl/exceptions.hpp>

static_assert(OPENSSL_VERSION_NUMBER >= 0x10101000L, "Use OpenSSL version 1.1.1 or later");

namespace asyncssl {

namespace {

auto memoryBio(std::string const& pem) -> BioPtr
{
    BioPtr bio{BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()))};
    if (!bio) {
        throw ConfigError{"error BIO_new_mem_buf"};
    }
    return bio;
}

auto toProtocolVersion(TlsVersion version) -> int
{
    switch (version) {
    case TlsVersion::VERSION_1_0:
        return TLS1_VERSION;
    case TlsVersion::VERSION_1_1:
        return TLS1_1_VERSION;
    case TlsVersion::VERSION_1_2:
        return TLS1_2_VERSION;
    case TlsVersion::VERSION_1_3:
        return TLS1_3_VERSION;
    }
    return 0;
}

}  // namespace

SslContext::SslContext(TlsConfig config)
    : config_{std::move(config)}
{
    bool const isServer = config_.role() == TlsRole::SERVER;
    spdlog::debug("Creating {} context with {}", isServer ? "server" : "client", OPENSSL_VERSION_TEXT);

    ctx_ = SslCtxPtr{SSL_CTX_new(isServer ? TLS_server_method() : TLS_client_method())};
    if (!ctx_) {
        throw ConfigError{"error SSL_CTX_new"};
    }

    int const minTlsVersion = toProtocolVersion(config_.minTlsVersion());
    assert(minTlsVersion != 0);

    if (SSL_CTX_set_min_proto_version(ctx_.get(), minTlsVersion) < 1) {
        throw ConfigError{"error SSL_CTX_set_min_proto_version"};
    }

    // SSL_write may be retried with a buffer at another address after a would-block
    SSL_CTX_set_mode(ctx_.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (!isServer && !config_.insecure()) {
        this->loadVerifyLocations();
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_NONE, nullptr);
    }

    if (isServer || config_.hasIdentity()) {
        this->loadIdentity();
    }

#ifdef ASYNCSSL_HAS_EARLY_DATA
    if (isServer && config_.maxEarlyData() > 0) {
        if (SSL_CTX_set_max_early_data(ctx_.get(), config_.maxEarlyData()) < 1) {
            throw ConfigError{"error SSL_CTX_set_max_early_data"};
        }
    }
#endif
}

void SslContext::loadVerifyLocations()
{
    if (config_.useDefaultCa()) {

        auto const& caCert = TlsConfig::defaultCaCert();
        auto const& caPath = TlsConfig::defaultCaPath();

        auto const certFailed = SSL_CTX_load_verify_locations(ctx_.get(), caCert.c_str(), nullptr) < 1;
        auto const pathFailed = SSL_CTX_load_verify_locations(ctx_.get(), nullptr, caPath.c_str()) < 1;

        if (certFailed && pathFailed) {
            spdlog::error("Can't load default certs from {} or {}", caCert, caPath);
            throw ConfigError{"can't load default certs"};
        }
        // one of them failing is fine, forget about it
        ERR_clear_error();
        return;
    }

    if (config_.caCert() || config_.caPath()) {
        if (SSL_CTX_load_verify_locations(ctx_.get(),
                                          config_.caCert() ? config_.caCert()->c_str() : nullptr,
                                          config_.caPath() ? config_.caPath()->c_str() : nullptr) < 1)
        {
            throw ConfigError{"error SSL_CTX_load_verify_locations"};
        }
    }

    if (auto const& pem = config_.caCertPem(); pem) {
        auto const bio = memoryBio(*pem);
        X509_STORE *store = SSL_CTX_get_cert_store(ctx_.get());

        int count = 0;
        while (X509Ptr cert{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)}) {
            if (X509_STORE_add_cert(store, cert.get()) < 1) {
                throw ConfigError{"error X509_STORE_add_cert"};
            }
            count++;
        }
        // reading past the last certificate leaves an expected error behind
        ERR_clear_error();

        if (count == 0) {
            throw ConfigError{"no certificate in CA PEM"};
        }
    }
}

void SslContext::loadIdentity()
{
    if (auto const& path = config_.certificateChain(); path) {
        if (SSL_CTX_use_certificate_chain_file(ctx_.get(), path->c_str()) < 1) {
            throw ConfigError{"error SSL_CTX_use_certificate_chain_file " + *path};
        }
    } else if (auto const& pem = config_.certificateChainPem(); pem) {
        auto const bio = memoryBio(*pem);

        // first is the entity certificate, the rest are intermediates
        X509Ptr entity{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)};
        if (!entity || SSL_CTX_use_certificate(ctx_.get(), entity.get()) < 1) {
            throw ConfigError{"error SSL_CTX_use_certificate"};
        }
        while (X509Ptr cert{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)}) {
            // takes ownership on success
            if (SSL_CTX_add_extra_chain_cert(ctx_.get(), cert.get()) < 1) {
                throw ConfigError{"error SSL_CTX_add_extra_chain_cert"};
            }
            cert.release();
        }
        ERR_clear_error();
    } else {
        throw ConfigError{"a certificate chain is required"};
    }

    if (auto const& path = config_.privateKey(); path) {
        if (SSL_CTX_use_PrivateKey_file(ctx_.get(), path->c_str(), SSL_FILETYPE_PEM) < 1) {
            throw ConfigError{"error SSL_CTX_use_PrivateKey_file " + *path};
        }
    } else if (auto const& pem = config_.privateKeyPem(); pem) {
        auto const bio = memoryBio(*pem);
        EvpPkeyPtr key{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)};
        if (!key || SSL_CTX_use_PrivateKey(ctx_.get(), key.get()) < 1) {
            throw ConfigError{"error SSL_CTX_use_PrivateKey"};
        }
    } else {
        throw ConfigError{"a private key is required"};
    }

    if (SSL_CTX_check_private_key(ctx_.get()) < 1) {
        throw ConfigError{"private key does not match the certificate"};
    }
}

auto SslContext::newSsl() const -> SslPtr
{
    SslPtr ssl{SSL_new(ctx_.get())};
    if (!ssl) {
        throw ConfigError{"error SSL_new"};
    }

    if (config_.role() == TlsRole::CLIENT) {
        if (auto const& name = config_.serverName(); name) {
            // SNI
            if (SSL_set_tlsext_host_name(ssl.get(), name->c_str()) < 1) {
                throw ConfigError{"error SSL_set_tlsext_host_name"};
            }
            if (!config_.insecure() && SSL_set1_host(ssl.get(), name->c_str()) < 1) {
                throw ConfigError{"error SSL_set1_host"};
            }
        }
        SSL_set_connect_state(ssl.get());
    } else {
        SSL_set_accept_state(ssl.get());
    }

    return ssl;
}

}  // namespace asyncssl
