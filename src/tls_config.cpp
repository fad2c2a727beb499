#include <asyncssl/tls_config.hpp>

namespace asyncssl {

auto TlsConfig::defaultCaCert() -> std::string
{
    // TODO: different platforms
    return "/etc/ssl/cert.pem";
}

auto TlsConfig::defaultCaPath() -> std::string
{
    // TODO: different platforms
    return "/etc/ssl/certs";
}

}  // namespace asyncssl
