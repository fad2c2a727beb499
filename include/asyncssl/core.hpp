#ifndef ASYNCSSL_CORE_HPP_
#define ASYNCSSL_CORE_HPP_

#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#if OPENSSL_VERSION_NUMBER >= 0x10101000L && !defined(OPENSSL_NO_TLS1_3)
#define ASYNCSSL_HAS_EARLY_DATA 1
#endif

namespace asyncssl {

struct BioDeleter { void operator()(BIO *bio) { BIO_free_all(bio); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct SslDeleter { void operator()(SSL *ssl) { SSL_free(ssl); } };
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

struct SslCtxDeleter { void operator()(SSL_CTX *ctx) { SSL_CTX_free(ctx); } };
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

struct X509Deleter { void operator()(X509 *cert) { X509_free(cert); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

struct EvpPkeyDeleter { void operator()(EVP_PKEY *key) { EVP_PKEY_free(key); } };
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

}  // namespace asyncssl

#endif  // ASYNCSSL_CORE_HPP_
