#include <catch2/catch.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/executor.hpp>
#include <asyncssl/io.hpp>
#include <asyncssl/memory_stream.hpp>
#include <asyncssl/net/reactor.hpp>
#include <asyncssl/net/tcp.hpp>
#include <asyncssl/ssl_error.hpp>
#include <asyncssl/ssl_stream.hpp>

#include "test_utils.hpp"

using namespace asyncssl;
using testing::bytes;
using testing::makeStreams;
using testing::text;

namespace {

void runBoth(FuturePtr<void> client, FuturePtr<void> server)
{
    LocalExecutor executor;
    executor.spawn(std::move(client));
    executor.spawn(std::move(server));
    executor.run();
}

template <typename T>
auto storeInto(FuturePtr<T> future, T& out) -> FuturePtr<void>
{
    return pollFn<void>([future = std::move(future), &out](Context& cx) mutable -> Poll<void> {
        auto result = future->poll(cx);
        if (result.isPending()) {
            return Pending{};
        }
        out = result.value();
        return ready();
    });
}

auto memoryTransport(AsyncSslStream& stream) -> MemoryStream&
{
    return dynamic_cast<MemoryStream&>(stream.getMut());
}

}  // namespace

TEST_CASE("AsyncSslStream/handshake", "[ssl-stream]") {

    SECTION("connect and accept") {
        auto const streams = makeStreams();
        runBoth(streams.client->connect(), streams.server->accept());

        REQUIRE(SSL_is_init_finished(streams.client->ssl()));
        REQUIRE(SSL_is_init_finished(streams.server->ssl()));
        REQUIRE(std::string{SSL_get_version(streams.client->ssl())} == SSL_get_version(streams.server->ssl()));
    }

    SECTION("do handshake on both sides") {
        auto const streams = makeStreams();
        runBoth(streams.client->doHandshake(), streams.server->doHandshake());

        REQUIRE(SSL_is_init_finished(streams.client->ssl()));
        REQUIRE(SSL_is_init_finished(streams.server->ssl()));
    }

    SECTION("tiny transport buffers force many retries") {
        auto const streams = makeStreams(testing::clientContext(), testing::serverContext(), 64);
        auto& client = *streams.client;
        auto& server = *streams.server;
        std::vector<uint8_t> received;

        // the server's post-handshake messages only fit if the client keeps reading
        runBoth(
            sequence({
                [&] { return client.connect(); },
                [&] { return readToEnd(client, received); },
                [&] { return shutdown(client); },
            }),
            sequence({
                [&] { return server.accept(); },
                [&] { return shutdown(server); },
            }));

        REQUIRE(SSL_is_init_finished(client.ssl()));
        REQUIRE(SSL_is_init_finished(server.ssl()));
        REQUIRE(received.empty());
        REQUIRE(memoryTransport(client).bytesWritten() > 64);
        REQUIRE(memoryTransport(server).bytesWritten() > 64);
    }

    SECTION("pending until the peer answers") {
        auto const streams = makeStreams();

        bool woken = false;
        Waker waker{[&] { woken = true; }};
        Context cx{waker};

        REQUIRE(streams.client->pollConnect(cx).isPending());
        REQUIRE(!woken);

        Waker serverWaker;
        Context serverCx{serverWaker};
        REQUIRE(streams.server->pollAccept(serverCx).isPending());
        REQUIRE(woken);

        REQUIRE(streams.client->pollConnect(cx).isReady());
        REQUIRE(streams.server->pollAccept(serverCx).isReady());
    }
}

TEST_CASE("AsyncSslStream/accessors", "[ssl-stream]") {
    auto pipe = MemoryStream::pair();
    auto *transport = pipe.first.get();
    auto const context = testing::clientContext();
    AsyncSslStream stream{context, std::move(pipe.first)};

    AsyncSslStream const& view = stream;
    REQUIRE(&stream.getMut() == transport);
    REQUIRE(&view.getRef() == transport);
    REQUIRE(stream.ssl() != nullptr);
    REQUIRE(view.ssl() == stream.ssl());
    REQUIRE(!SSL_is_server(stream.ssl()));
}

TEST_CASE("AsyncSslStream/round trip", "[ssl-stream]") {
    auto const size = GENERATE(as<size_t>{}, 0, 1, 100000);

    std::vector<uint8_t> payload(size);
    for (size_t i = 0; i < size; i++) {
        payload[i] = static_cast<uint8_t>(i * 7 % 251);
    }
    std::vector<uint8_t> received;

    auto const streams = makeStreams();
    auto& client = *streams.client;
    auto& server = *streams.server;

    runBoth(
        sequence({
            [&] { return client.connect(); },
            [&] { return writeAll(client, payload.data(), payload.size()); },
            [&] { return flush(client); },
            [&] { return shutdown(client); },
        }),
        sequence({
            [&] { return server.accept(); },
            [&] { return readToEnd(server, received); },
            [&] { return shutdown(server); },
        }));

    REQUIRE(received == payload);
}

TEST_CASE("AsyncSslStream/request and response", "[ssl-stream]") {
    auto const streams = makeStreams();
    auto& client = *streams.client;
    auto& server = *streams.server;

    std::string const request{"asdf"};
    std::string const response{"jkl;"};
    std::vector<uint8_t> serverReceived(4);
    std::vector<uint8_t> clientReceived;

    runBoth(
        sequence({
            [&] { return client.connect(); },
            [&] { return writeAll(client, request); },
            [&] { return readToEnd(client, clientReceived); },
            [&] { return shutdown(client); },
        }),
        sequence({
            [&] { return server.accept(); },
            [&] { return readExact(server, serverReceived.data(), serverReceived.size()); },
            [&] { return writeAll(server, response); },
            [&] { return shutdown(server); },
        }));

    REQUIRE(text(serverReceived) == "asdf");
    REQUIRE(text(clientReceived) == "jkl;");
}

TEST_CASE("AsyncSslStream/raw engine I/O", "[ssl-stream]") {
    auto const streams = makeStreams();
    auto& client = *streams.client;
    auto& server = *streams.server;

    auto const message = bytes("ping");
    size_t written = 0;
    size_t read = 0;
    uint8_t buffer[16];
    auto closeCode = SslErrorCode::NONE;

    runBoth(
        sequence({
            [&] { return client.connect(); },
            [&] { return storeInto(client.sslWrite(message.data(), message.size()), written); },
            [&] { return shutdown(client); },
        }),
        sequence({
            [&] { return server.accept(); },
            [&] { return storeInto(server.sslRead(buffer, sizeof(buffer)), read); },
            [&] {
                return pollFn<void>([&](Context& cx) -> Poll<void> {
                    uint8_t rest[16];
                    try {
                        if (server.pollSslRead(cx, rest, sizeof(rest)).isPending()) {
                            return Pending{};
                        }
                    }
                    catch (SslError const& e) {
                        closeCode = e.code();
                    }
                    return ready();
                });
            },
            [&] { return shutdown(server); },
        }));

    REQUIRE(written == 4);
    REQUIRE(read == 4);
    REQUIRE(std::string(reinterpret_cast<char *>(buffer), read) == "ping");
    REQUIRE(closeCode == SslErrorCode::ZERO_RETURN);
}

TEST_CASE("AsyncSslStream/vectored write", "[ssl-stream]") {
    auto const streams = makeStreams();
    auto& client = *streams.client;
    auto& server = *streams.server;

    IoSlice const slices[] = {
        {nullptr, 0},
        {reinterpret_cast<uint8_t const *>("abc"), 3},
        {reinterpret_cast<uint8_t const *>("def"), 3},
    };
    size_t written = 0;
    std::vector<uint8_t> received(3);

    REQUIRE(!client.isWriteVectored());

    runBoth(
        sequence({
            [&] { return client.connect(); },
            [&] {
                return pollFn<void>([&](Context& cx) -> Poll<void> {
                    auto result = client.pollWriteVectored(cx, slices, 3);
                    if (result.isPending()) {
                        return Pending{};
                    }
                    written = result.value();
                    return ready();
                });
            },
        }),
        sequence({
            [&] { return server.accept(); },
            [&] { return readExact(server, received.data(), received.size()); },
        }));

    REQUIRE(written == 3);
    REQUIRE(text(received) == "abc");
}

TEST_CASE("AsyncSslStream/shutdown", "[ssl-stream][shutdown]") {
    LocalExecutor executor;
    auto streams = makeStreams();
    std::vector<uint8_t> received;

    SECTION("server only, client goes away") {
        // the client task owns its stream, which is dropped once it completes
        auto client = std::move(streams.client);
        auto& server = *streams.server;

        executor.spawn(sequence({
            [client] { return client->connect(); },
            [client, &received] { return readToEnd(*client, received); },
        }));
        client.reset();
        executor.spawn(sequence({
            [&] { return server.accept(); },
            [&] { return shutdown(server); },
        }));
        executor.run();

        REQUIRE(received.empty());
    }

    SECTION("client only, server goes away") {
        auto& client = *streams.client;
        auto server = std::move(streams.server);

        executor.spawn(sequence({
            [&] { return client.connect(); },
            [&] { return shutdown(client); },
        }));
        executor.spawn(sequence({
            [server] { return server->accept(); },
            [server, &received] { return readToEnd(*server, received); },
        }));
        server.reset();
        executor.run();

        REQUIRE(received.empty());
    }

    SECTION("both sides") {
        auto& client = *streams.client;
        auto& server = *streams.server;

        executor.spawn(sequence({
            [&] { return client.connect(); },
            [&] { return shutdown(client); },
        }));
        executor.spawn(sequence({
            [&] { return server.accept(); },
            [&] { return shutdown(server); },
        }));
        executor.run();

        REQUIRE((SSL_get_shutdown(client.ssl()) & SSL_SENT_SHUTDOWN) != 0);
        REQUIRE((SSL_get_shutdown(server.ssl()) & SSL_SENT_SHUTDOWN) != 0);
    }

    SECTION("neither side") {
        auto& server = *streams.server;
        std::string const message{"bye"};

        executor.spawn(sequence({
            [&] { return streams.client->connect(); },
            [&] { return writeAll(*streams.client, message); },
        }));
        executor.spawn(sequence({
            [&] { return server.accept(); },
            [&] { return readToEnd(server, received); },
        }));

        // nothing ends the server's read while the client stream is alive
        REQUIRE_THROWS_AS(executor.run(), AsyncSslException);
        REQUIRE(executor.pendingTasks() == 1);

        // dropped without close_notify
        streams.client.reset();
        executor.run();
        REQUIRE(text(received) == "bye");
    }

    SECTION("application data dropped while draining") {
        auto& client = *streams.client;
        auto& server = *streams.server;
        std::vector<uint8_t> const payload(20000, 'x');

        executor.spawn(sequence({
            [&] { return client.connect(); },
            [&] { return writeAll(client, payload.data(), payload.size()); },
            [&] { return shutdown(client); },
        }));
        executor.spawn(sequence({
            [&] { return server.accept(); },
            [&] { return shutdown(server); },
        }));
        executor.run();

        REQUIRE((SSL_get_shutdown(server.ssl()) & SSL_RECEIVED_SHUTDOWN) != 0);
        REQUIRE(memoryTransport(server).bytesRead() > payload.size());
    }

    SECTION("close_notify already read") {
        auto& client = *streams.client;
        auto& server = *streams.server;
        auto closeCode = SslErrorCode::NONE;

        executor.spawn(sequence({
            [&] { return client.connect(); },
            [&] { return shutdown(client); },
        }));
        executor.spawn(sequence({
            [&] { return server.accept(); },
            [&] {
                return pollFn<void>([&](Context& cx) -> Poll<void> {
                    uint8_t buffer[16];
                    try {
                        if (server.pollSslRead(cx, buffer, sizeof(buffer)).isPending()) {
                            return Pending{};
                        }
                    }
                    catch (SslError const& e) {
                        closeCode = e.code();
                    }
                    return ready();
                });
            },
            [&] { return shutdown(server); },
        }));
        executor.run();

        REQUIRE(closeCode == SslErrorCode::ZERO_RETURN);
        REQUIRE(SSL_get_shutdown(server.ssl()) == (SSL_SENT_SHUTDOWN | SSL_RECEIVED_SHUTDOWN));
        REQUIRE(SSL_get_shutdown(client.ssl()) == (SSL_SENT_SHUTDOWN | SSL_RECEIVED_SHUTDOWN));
    }

    SECTION("before the handshake") {
        executor.spawn(shutdown(*streams.client));
        try {
            executor.run();
            FAIL("shutdown should fail");
        }
        catch (IoError const& e) {
            REQUIRE(e.code() == std::errc::io_error);
        }
    }

    SECTION("transport ends while draining") {
        auto& client = *streams.client;
        auto& server = *streams.server;

        executor.spawn(sequence({
            [&] { return client.connect(); },
            // closes the transport without close_notify
            [&] { return shutdown(client.getMut()); },
        }));
        executor.spawn(sequence({
            [&] { return server.accept(); },
            [&] { return shutdown(server); },
        }));
        executor.run();

        REQUIRE((SSL_get_shutdown(server.ssl()) & SSL_RECEIVED_SHUTDOWN) == 0);
    }

    SECTION("transport failure while draining") {
        auto& client = *streams.client;
        auto& server = *streams.server;

        executor.spawn(client.connect());
        executor.spawn(server.accept());
        executor.run();

        memoryTransport(server).failNextRead(std::make_error_code(std::errc::connection_reset));
        executor.spawn(shutdown(server));
        try {
            executor.run();
            FAIL("shutdown should fail");
        }
        catch (IoError const& e) {
            REQUIRE(e.code() == std::errc::connection_reset);
        }
    }
}

TEST_CASE("AsyncSslStream/certificate verification", "[ssl-stream]") {
    LocalExecutor executor;

    SECTION("wrong host name") {
        auto const streams = makeStreams(testing::clientContext("example.com"), testing::serverContext());
        executor.spawn(streams.client->connect());
        executor.spawn(streams.server->accept());

        try {
            executor.run();
            FAIL("handshake should fail");
        }
        catch (SslError const& e) {
            REQUIRE(e.code() == SslErrorCode::SSL);
            REQUIRE(e.ioError() == nullptr);
        }
    }

    SECTION("insecure skips verification") {
        auto const insecure = SslContext{TlsConfig::Builder{}
            .role(TlsRole::CLIENT)
            .serverName("example.com")
            .insecure(true)
            .build()};
        auto const streams = makeStreams(insecure, testing::serverContext());
        executor.spawn(streams.client->connect());
        executor.spawn(streams.server->accept());
        executor.run();

        REQUIRE(SSL_is_init_finished(streams.client->ssl()));
    }
}

#ifdef ASYNCSSL_HAS_EARLY_DATA
TEST_CASE("AsyncSslStream/early data", "[ssl-stream][early-data]") {
    auto const streams = makeStreams(testing::clientContext(), testing::serverContext(16384));
    auto& client = *streams.client;
    auto& server = *streams.server;

    SECTION("no early data from a fresh client") {
        uint8_t buffer[64];
        size_t earlyRead = 1;
        std::string const message{"hello"};
        std::vector<uint8_t> received(5);

        runBoth(
            sequence({
                [&] { return client.connect(); },
                [&] { return writeAll(client, message); },
            }),
            sequence({
                [&] { return storeInto(server.readEarlyData(buffer, sizeof(buffer)), earlyRead); },
                [&] { return server.accept(); },
                [&] { return readExact(server, received.data(), received.size()); },
            }));

        REQUIRE(earlyRead == 0);
        REQUIRE(text(received) == "hello");
    }

    SECTION("client without a resumable session") {
        auto const message = bytes("early");
        size_t written = 0;

        LocalExecutor executor;
        executor.spawn(storeInto(client.writeEarlyData(message.data(), message.size()), written));
        REQUIRE_THROWS_AS(executor.run(), SslError);
    }
}
#endif

TEST_CASE("AsyncSslStream/tcp loopback", "[ssl-stream][tcp]") {
    Reactor reactor;
    LocalExecutor executor{&reactor};
    TcpListener listener{reactor, "127.0.0.1", "0"};

    auto const clientCtx = testing::clientContext();
    auto const serverCtx = testing::serverContext();

    auto tcp = TcpStream::open(reactor, "127.0.0.1", std::to_string(listener.localPort()));
    auto *socket = tcp.get();
    AsyncSslStream client{clientCtx, std::move(tcp)};
    std::unique_ptr<AsyncSslStream> server;

    std::string const request{"asdf"};
    std::string const response{"jkl;"};
    std::vector<uint8_t> serverReceived(4);
    std::vector<uint8_t> clientReceived;

    executor.spawn(sequence({
        [&] { return socket->connected(); },
        [&] { return client.connect(); },
        [&] { return writeAll(client, request); },
        [&] { return readToEnd(client, clientReceived); },
        [&] { return shutdown(client); },
    }));
    executor.spawn(sequence({
        [&] {
            return pollFn<void>([&](Context& cx) -> Poll<void> {
                auto accepted = listener.pollAccept(cx);
                if (accepted.isPending()) {
                    return Pending{};
                }
                server = std::make_unique<AsyncSslStream>(serverCtx, std::move(accepted.value()));
                return ready();
            });
        },
        [&] { return server->accept(); },
        [&] { return readExact(*server, serverReceived.data(), serverReceived.size()); },
        [&] { return writeAll(*server, response); },
        [&] { return shutdown(*server); },
    }));
    executor.run();

    REQUIRE(text(serverReceived) == "asdf");
    REQUIRE(text(clientReceived) == "jkl;");
}
