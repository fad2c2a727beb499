#ifndef ASYNCSSL_OPENSSL_BRIDGE_HPP_
#define ASYNCSSL_OPENSSL_BRIDGE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>

#include <openssl/bio.h>

#include <asyncssl/async_stream.hpp>
#include <asyncssl/exceptions.hpp>

namespace asyncssl {

// Blocking-style duplex channel over an AsyncStream.
//
// Each call polls the transport exactly once with the Context installed by
// a ContextScope. Where the transport is pending, the call throws
// IoError::wouldBlock() instead of blocking. The engine reaches the bridge
// through a BIO created by createBio().
//
// The bridge must stay at the same address while a BIO refers to it.
class StreamBridge {
public:
    explicit StreamBridge(AsyncStreamPtr stream);

    StreamBridge(StreamBridge const&) = delete;
    StreamBridge& operator=(StreamBridge const&) = delete;

    auto stream() -> AsyncStream& { return *stream_; }
    auto stream() const -> AsyncStream const& { return *stream_; }

    // 0 means end of stream
    auto read(uint8_t *data, size_t size) -> size_t;
    auto write(uint8_t const *data, size_t size) -> size_t;
    void flush();
    auto writeVectored(IoSlice const *slices, size_t count) -> size_t;

    bool hasContext() const { return context_ != nullptr; }

    // The failure recorded by the last BIO callback, cleared by this call.
    auto takeError() -> std::optional<IoError>;

    // Caller owns the returned BIO, which does not own the bridge.
    auto createBio() -> BIO *;

private:
    friend class ContextScope;
    friend struct BridgeBioMethod;

    AsyncStreamPtr stream_;
    Context *context_;  // borrowed, only set inside a ContextScope
    std::optional<IoError> error_;

    auto context() -> Context&;
};

// Makes a Context reachable from the bridge for the lifetime of the scope.
//
// Installing over an already installed context is a misuse and throws
// std::logic_error.
class ContextScope {
public:
    ContextScope(StreamBridge& bridge, Context& cx);
    ~ContextScope();

    ContextScope(ContextScope const&) = delete;
    ContextScope& operator=(ContextScope const&) = delete;

private:
    StreamBridge& bridge_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_OPENSSL_BRIDGE_HPP_
