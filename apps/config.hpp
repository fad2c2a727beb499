#ifndef APP_CONFIG_HPP_
#define APP_CONFIG_HPP_

#include <string>

#include <asyncssl/tls_config.hpp>

struct Config
{
    std::string host;
    std::string port{"443"};

    asyncssl::TlsVersion minTlsVersion{asyncssl::TlsVersion::VERSION_1_2};

    std::string caCert;
    std::string caPath;
    std::string serverName;  // defaults to host

    bool insecure{false};

    std::string request;  // defaults to a HTTP/1.0 GET for /

    bool isVerbose{false};

    Config(int argc, char *argv[]);
};

#endif  // APP_CONFIG_HPP_
