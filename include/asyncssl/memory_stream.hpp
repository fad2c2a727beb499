#ifndef ASYNCSSL_MEMORY_STREAM_HPP_
#define ASYNCSSL_MEMORY_STREAM_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

#include <asyncssl/async_stream.hpp>

namespace asyncssl {

// One end of an in-memory duplex pipe with bounded buffering.
//
// Destroying an end closes both directions abruptly: the peer reads end of
// stream and its writes fail with broken_pipe.
class MemoryStream : public AsyncStream {
    struct Pipe;
    struct PrivateTag {};

public:
    static constexpr size_t DEFAULT_CAPACITY = 64 * 1024;

    using Pair = std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>>;
    static auto pair(size_t capacity = DEFAULT_CAPACITY) -> Pair;

    // use pair()
    MemoryStream(PrivateTag, std::shared_ptr<Pipe> inbound, std::shared_ptr<Pipe> outbound);
    ~MemoryStream() override;

    MemoryStream(MemoryStream const&) = delete;
    MemoryStream& operator=(MemoryStream const&) = delete;

    auto pollRead(Context& cx, ReadBuf& buf) -> Poll<void> override;
    auto pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t> override;
    auto pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t> override;
    auto pollFlush(Context& cx) -> Poll<void> override;
    auto pollShutdown(Context& cx) -> Poll<void> override;

    bool isWriteVectored() const override { return true; }

    // The next read or write throws IoError with the given code.
    void failNextRead(std::error_code code) { readFailure_ = code; }
    void failNextWrite(std::error_code code) { writeFailure_ = code; }

    auto bytesRead() const -> size_t { return bytesRead_; }
    auto bytesWritten() const -> size_t { return bytesWritten_; }

private:
    std::shared_ptr<Pipe> inbound_;
    std::shared_ptr<Pipe> outbound_;
    std::optional<std::error_code> readFailure_;
    std::optional<std::error_code> writeFailure_;
    size_t bytesRead_;
    size_t bytesWritten_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_MEMORY_STREAM_HPP_
