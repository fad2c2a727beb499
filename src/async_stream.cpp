#include <asyncssl/async_stream.hpp>

namespace asyncssl {

auto AsyncStream::pollWriteVectored(Context& cx, IoSlice const *slices, size_t count) -> Poll<size_t>
{
    for (size_t i = 0; i < count; i++) {
        if (slices[i].size > 0) {
            return this->pollWrite(cx, slices[i].data, slices[i].size);
        }
    }
    return this->pollWrite(cx, nullptr, 0);
}

}  // namespace asyncssl
