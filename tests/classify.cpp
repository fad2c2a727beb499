#include <catch2/catch.hpp>

#include <system_error>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/ssl_error.hpp>

#include "classify.hpp"

using namespace asyncssl;

TEST_CASE("cvtIo", "[classify]") {

    SECTION("value is ready") {
        auto const result = cvtIo([] { return 42; });
        REQUIRE(result.isReady());
        REQUIRE(result.value() == 42);
    }

    SECTION("void is ready") {
        bool called = false;
        auto const result = cvtIo([&] { called = true; });
        REQUIRE(result.isReady());
        REQUIRE(called);
    }

    SECTION("would-block is pending") {
        auto const code = GENERATE(std::errc::operation_would_block, std::errc::resource_unavailable_try_again);
        auto const result = cvtIo([&]() -> int { throw IoError{std::make_error_code(code)}; });
        REQUIRE(result.isPending());
    }

    SECTION("other errors propagate") {
        auto const code = GENERATE(std::errc::broken_pipe, std::errc::connection_reset, std::errc::io_error);
        REQUIRE_THROWS_AS(cvtIo([&] { throw IoError{std::make_error_code(code)}; }), IoError);
    }

    SECTION("engine errors are not transport errors") {
        auto const f = [] { throw SslError{SslErrorCode::WANT_READ, "", std::nullopt}; };
        REQUIRE_THROWS_AS(cvtIo(f), SslError);
    }
}

TEST_CASE("cvtSsl", "[classify]") {

    SECTION("value is ready") {
        auto const result = cvtSsl([] { return size_t{7}; });
        REQUIRE(result.isReady());
        REQUIRE(result.value() == 7);
    }

    SECTION("want read or write is pending") {
        auto const code = GENERATE(SslErrorCode::WANT_READ, SslErrorCode::WANT_WRITE);
        auto const result = cvtSsl([&] { throw SslError{code, "", IoError::wouldBlock()}; });
        REQUIRE(result.isPending());
    }

    SECTION("anything else propagates") {
        auto const code = GENERATE(SslErrorCode::SSL, SslErrorCode::SYSCALL, SslErrorCode::ZERO_RETURN,
                                   SslErrorCode::WANT_X509_LOOKUP, SslErrorCode::WANT_CONNECT,
                                   SslErrorCode::WANT_ACCEPT, SslErrorCode::OTHER);
        REQUIRE_THROWS_AS(cvtSsl([&] { throw SslError{code, "", std::nullopt}; }), SslError);
    }

    SECTION("would-block from the transport alone is not pending") {
        REQUIRE_THROWS_AS(cvtSsl([] { throw IoError::wouldBlock(); }), IoError);
    }
}

TEST_CASE("SslError/intoIoError", "[classify]") {

    SECTION("attached transport error") {
        SslError const e{SslErrorCode::SYSCALL, "", IoError{std::make_error_code(std::errc::connection_reset)}};
        REQUIRE(e.ioError() != nullptr);
        REQUIRE(e.intoIoError().code() == std::errc::connection_reset);
    }

    SECTION("engine error wrapped") {
        SslError const e{SslErrorCode::SSL, "certificate verify failed", std::nullopt};
        REQUIRE(e.ioError() == nullptr);

        auto const io = e.intoIoError();
        REQUIRE(io.code() == std::errc::io_error);
        REQUIRE(std::string{io.what()}.find("certificate verify failed") != std::string::npos);
    }
}
