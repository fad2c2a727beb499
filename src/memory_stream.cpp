#include <asyncssl/memory_stream.hpp>

#include <algorithm>
#include <deque>

#include <asyncssl/exceptions.hpp>

namespace asyncssl {

struct MemoryStream::Pipe {
    std::deque<uint8_t> data;
    size_t capacity;
    bool writerClosed = false;
    bool readerClosed = false;
    Waker reader;
    Waker writer;

    explicit Pipe(size_t capacity) : capacity{capacity} {}

    auto space() const -> size_t { return capacity - std::min(capacity, data.size()); }

    void wakeReader()
    {
        auto const waker = std::move(reader);
        reader = Waker{};
        waker.wake();
    }

    void wakeWriter()
    {
        auto const waker = std::move(writer);
        writer = Waker{};
        waker.wake();
    }
};

auto MemoryStream::pair(size_t capacity) -> Pair
{
    auto const forward = std::make_shared<Pipe>(capacity);
    auto const backward = std::make_shared<Pipe>(capacity);
    return {
        std::make_unique<MemoryStream>(PrivateTag{}, backward, forward),
        std::make_unique<MemoryStream>(PrivateTag{}, forward, backward),
    };
}

MemoryStream::MemoryStream(PrivateTag, std::shared_ptr<Pipe> inbound, std::shared_ptr<Pipe> outbound)
    : inbound_{std::move(inbound)}, outbound_{std::move(outbound)}
    , bytesRead_{0}, bytesWritten_{0}
{
}

MemoryStream::~MemoryStream()
{
    outbound_->writerClosed = true;
    inbound_->readerClosed = true;
    outbound_->wakeReader();
    inbound_->wakeWriter();
}

auto MemoryStream::pollRead(Context& cx, ReadBuf& buf) -> Poll<void>
{
    if (readFailure_) {
        auto const code = *readFailure_;
        readFailure_.reset();
        throw IoError{code};
    }

    auto& pipe = *inbound_;
    if (!pipe.data.empty()) {
        size_t const n = std::min(buf.remaining(), pipe.data.size());
        auto *dest = buf.unfilled();
        std::copy_n(std::begin(pipe.data), n, dest);
        pipe.data.erase(std::begin(pipe.data), std::begin(pipe.data) + n);
        buf.assumeInit(n);
        buf.advance(n);
        bytesRead_ += n;
        pipe.wakeWriter();
        return ready();
    }

    if (pipe.writerClosed) {
        return ready();
    }

    pipe.reader = cx.waker();
    return Pending{};
}

auto MemoryStream::pollWrite(Context& cx, uint8_t const *data, size_t size) -> Poll<size_t>
{
    IoSlice const slice{data, size};
    return this->pollWriteVectored(cx, &slice, 1);
}

auto MemoryStream::pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t>
{
    if (writeFailure_) {
        auto const code = *writeFailure_;
        writeFailure_.reset();
        throw IoError{code};
    }

    auto& pipe = *outbound_;
    if (pipe.readerClosed || pipe.writerClosed) {
        throw IoError{std::make_error_code(std::errc::broken_pipe)};
    }

    size_t total = 0;
    for (size_t i = 0; i < count; i++) {
        total += slices[i].size;
    }
    if (total == 0) {
        return size_t{0};
    }

    if (pipe.space() == 0) {
        pipe.writer = cx.waker();
        return Pending{};
    }

    size_t written = 0;
    for (size_t i = 0; i < count && pipe.space() > 0; i++) {
        size_t const n = std::min(slices[i].size, pipe.space());
        pipe.data.insert(std::end(pipe.data), slices[i].data, slices[i].data + n);
        written += n;
    }

    bytesWritten_ += written;
    pipe.wakeReader();
    return written;
}

auto MemoryStream::pollFlush(Context&) -> Poll<void>
{
    return ready();
}

auto MemoryStream::pollShutdown(Context&) -> Poll<void>
{
    outbound_->writerClosed = true;
    outbound_->wakeReader();
    return ready();
}

}  // namespace asyncssl
