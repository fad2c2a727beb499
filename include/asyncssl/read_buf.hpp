#ifndef ASYNCSSL_READ_BUF_HPP_
#define ASYNCSSL_READ_BUF_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace asyncssl {

// A caller-provided destination region for reads.
//
// The region is split into three parts:
//   [0, filled)             bytes written by reads so far
//   [filled, initialized)   bytes known to be initialized but not yet filled
//   [initialized, capacity) memory whose content must not be read
// Only the filled part is ever exposed as data.
class ReadBuf {
public:
    // not owning; the region may be uninitialized
    ReadBuf(uint8_t *data, size_t capacity);

    auto capacity() const -> size_t { return capacity_; }
    auto filledSize() const -> size_t { return filled_; }
    auto initializedSize() const -> size_t { return initialized_; }
    auto remaining() const -> size_t { return capacity_ - filled_; }

    auto filled() const -> uint8_t const * { return data_; }
    auto filledAsString() const -> std::string_view;

    // Start of the unfilled part. Writing is fine, reading is not.
    auto unfilled() -> uint8_t * { return data_ + filled_; }

    // Declares that n bytes past the filled part were written.
    void assumeInit(size_t n);

    // Moves the filled mark forward over already initialized bytes.
    void advance(size_t n);

private:
    uint8_t *data_;
    size_t capacity_;
    size_t filled_;
    size_t initialized_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_READ_BUF_HPP_
