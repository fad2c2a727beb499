#ifndef ASYNCSSL_ASYNC_STREAM_HPP_
#define ASYNCSSL_ASYNC_STREAM_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>

#include <asyncssl/context.hpp>
#include <asyncssl/poll.hpp>
#include <asyncssl/read_buf.hpp>

namespace asyncssl {

struct IoSlice {
    uint8_t const *data;
    size_t size;
};

// Non-blocking duplex byte stream.
//
// Every operation either completes, returns Pending after arranging for
// cx.waker() to be woken, or throws IoError. None of them may block.
class AsyncStream {
public:
    virtual ~AsyncStream() = default;

    // Ready with nothing filled means end of stream.
    virtual auto pollRead(Context& cx, ReadBuf& buf) -> Poll<void> = 0;

    virtual auto pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t> = 0;
    virtual auto pollFlush(Context& cx) -> Poll<void> = 0;
    virtual auto pollShutdown(Context& cx) -> Poll<void> = 0;

    // Writes the first non-empty slice unless overridden.
    virtual auto pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t>;

    virtual bool isWriteVectored() const { return false; }
};

using AsyncStreamPtr = std::unique_ptr<AsyncStream>;

}  // namespace asyncssl

#endif  // ASYNCSSL_ASYNC_STREAM_HPP_
