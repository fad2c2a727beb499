#include "config.hpp"

#include <cstdlib>

#include <CLI/CLI.hpp>

using asyncssl::TlsVersion;

Config::Config(int argc, char *argv[])
{
    CLI::App app{"Async TLS Client Demo"};

    app.add_option("host", host, "Server to connect to, optionally as host:port")
        ->required();
    app.add_option("port", port, "Server port")
        ->default_val(port);

    app.add_flag_callback("--tlsv1.0", [&](){ minTlsVersion = TlsVersion::VERSION_1_0; }, "Use TLSv1.0 or greater");
    app.add_flag_callback("--tlsv1.1", [&](){ minTlsVersion = TlsVersion::VERSION_1_1; }, "Use TLSv1.1 or greater");
    app.add_flag_callback("--tlsv1.2", [&](){ minTlsVersion = TlsVersion::VERSION_1_2; }, "Use TLSv1.2 or greater");
    app.add_flag_callback("--tlsv1.3", [&](){ minTlsVersion = TlsVersion::VERSION_1_3; }, "Use TLSv1.3 or greater");

    app.add_option("--cacert", caCert, "CA certificate to verify peer against")
        ->check(CLI::ExistingFile);
    app.add_option("--capath", caPath, "CA directory to verify peer against")
        ->check(CLI::ExistingDirectory);
    app.add_option("--servername", serverName, "Server name sent with SNI and verified against the certificate");

    app.add_flag("-k,--insecure", insecure, "Allow insecure server connections")
        ->default_val(insecure);

    app.add_option("--send", request, "Data to send instead of a HTTP GET request");

    app.add_flag("--verbose", isVerbose, "Make the operation more talkative");

    try {
        app.parse(argc, argv);
    }
    catch (CLI::ParseError const& e) {
        std::exit(app.exit(e));
    }

    // host:port, but leave bare IPv6 addresses alone
    auto const colon = host.rfind(':');
    if (colon != std::string::npos && host.find(':') == colon) {
        port = host.substr(colon + 1);
        host.erase(colon);
    }
    if (serverName.empty()) {
        serverName = host;
    }
    if (request.empty()) {
        request = "GET / HTTP/1.0\r\nHost: " + host + "\r\nConnection: close\r\n\r\n";
    }
}
