#ifndef ASYNCSSL_IO_HPP_
#define ASYNCSSL_IO_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <asyncssl/async_stream.hpp>
#include <asyncssl/future.hpp>

namespace asyncssl {

// Futures over an AsyncStream. The stream and the buffers are borrowed
// until the future completes.

auto writeAll(AsyncStream& stream, uint8_t const *data, size_t size) -> FuturePtr<void>;
auto writeAll(AsyncStream& stream, std::string const& data) -> FuturePtr<void>;

// Throws EndOfStreamError if the stream ends before size bytes were read.
auto readExact(AsyncStream& stream, uint8_t *data, size_t size) -> FuturePtr<void>;

// Appends to out until end of stream.
auto readToEnd(AsyncStream& stream, std::vector<uint8_t>& out) -> FuturePtr<void>;

auto flush(AsyncStream& stream) -> FuturePtr<void>;
auto shutdown(AsyncStream& stream) -> FuturePtr<void>;

}  // namespace asyncssl

#endif  // ASYNCSSL_IO_HPP_
