#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/executor.hpp>
#include <asyncssl/io.hpp>
#include <asyncssl/net/reactor.hpp>
#include <asyncssl/net/tcp.hpp>
#include <asyncssl/ssl_context.hpp>
#include <asyncssl/ssl_stream.hpp>
#include <asyncssl/tls_config.hpp>

#include "config.hpp"

using namespace asyncssl;

int main(int argc, char *argv[])
try {
    Config config{argc, argv};

    spdlog::set_level(config.isVerbose ? spdlog::level::debug : spdlog::level::warn);

    auto configBuilder = TlsConfig::Builder()
        .role(TlsRole::CLIENT)
        .minTlsVersion(config.minTlsVersion)
        .serverName(config.serverName)
        .insecure(config.insecure);

    if (!config.caCert.empty()) {
        configBuilder.caCert(config.caCert);
    }
    if (!config.caPath.empty()) {
        configBuilder.caPath(config.caPath);
    }

    SslContext context{configBuilder.build()};

    Reactor reactor;
    LocalExecutor executor{&reactor};

    auto tcp = TcpStream::open(reactor, config.host, config.port);
    auto *socket = tcp.get();
    AsyncSslStream stream{context, std::move(tcp)};

    std::vector<uint8_t> response;
    executor.spawn(sequence({
        [&] { return socket->connected(); },
        [&] { return stream.connect(); },
        [&] { return writeAll(stream, config.request); },
        [&] { return flush(stream); },
        [&] { return readToEnd(stream, response); },
    }));
    executor.run();

    std::fwrite(response.data(), 1, response.size(), stdout);
    std::fflush(stdout);

    // the server may already be gone
    try {
        executor.spawn(shutdown(stream));
        executor.run();
    }
    catch (IoError const& e) {
        spdlog::warn("Shutdown failed: {}", e.what());
    }
}
catch (AsyncSslException const& e) {
    spdlog::error("AsyncSslException: {}", e.what());
    return EXIT_FAILURE;
}
catch (std::exception const& e) {
    spdlog::error("Exception: {}", e.what());
    return EXIT_FAILURE;
}
