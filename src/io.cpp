#include <asyncssl/io.hpp>

#include <system_error>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/read_buf.hpp>

namespace asyncssl {

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

}  // namespace

auto writeAll(AsyncStream& stream, uint8_t const *data, size_t size) -> FuturePtr<void>
{
    return pollFn<void>([&stream, data, size, written = size_t{0}](Context& cx) mutable -> Poll<void> {
        while (written < size) {
            auto result = stream.pollWrite(cx, data + written, size - written);
            if (result.isPending()) {
                return Pending{};
            }
            if (result.value() == 0) {
                throw IoError{std::make_error_code(std::errc::io_error), "failed to write whole buffer"};
            }
            written += result.value();
        }
        return ready();
    });
}

auto writeAll(AsyncStream& stream, std::string const& data) -> FuturePtr<void>
{
    return writeAll(stream, reinterpret_cast<uint8_t const *>(data.data()), data.size());
}

auto readExact(AsyncStream& stream, uint8_t *data, size_t size) -> FuturePtr<void>
{
    return pollFn<void>([&stream, data, size, filled = size_t{0}](Context& cx) mutable -> Poll<void> {
        while (filled < size) {
            ReadBuf buf{data + filled, size - filled};
            if (stream.pollRead(cx, buf).isPending()) {
                return Pending{};
            }
            if (buf.filledSize() == 0) {
                throw EndOfStreamError{};
            }
            filled += buf.filledSize();
        }
        return ready();
    });
}

auto readToEnd(AsyncStream& stream, std::vector<uint8_t>& out) -> FuturePtr<void>
{
    return pollFn<void>([&stream, &out](Context& cx) -> Poll<void> {
        uint8_t chunk[READ_CHUNK_SIZE];
        while (true) {
            ReadBuf buf{chunk, sizeof(chunk)};
            if (stream.pollRead(cx, buf).isPending()) {
                return Pending{};
            }
            if (buf.filledSize() == 0) {
                return ready();
            }
            out.insert(out.end(), buf.filled(), buf.filled() + buf.filledSize());
        }
    });
}

auto flush(AsyncStream& stream) -> FuturePtr<void>
{
    return pollFn<void>([&stream](Context& cx) { return stream.pollFlush(cx); });
}

auto shutdown(AsyncStream& stream) -> FuturePtr<void>
{
    return pollFn<void>([&stream](Context& cx) { return stream.pollShutdown(cx); });
}

}  // namespace asyncssl
