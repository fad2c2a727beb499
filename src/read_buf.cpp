#include <asyncssl/read_buf.hpp>
#include <algorithm>
#include <cassert>

namespace asyncssl {

ReadBuf::ReadBuf(uint8_t *data, size_t capacity)
    : data_{data}, capacity_{capacity}
    , filled_{0}, initialized_{0}
{
    assert(data_ != nullptr || capacity_ == 0);
}

auto ReadBuf::filledAsString() const -> std::string_view
{
    return {reinterpret_cast<char const *>(data_), filled_};
}

void ReadBuf::assumeInit(size_t n)
{
    assert(filled_ + n <= capacity_);
    initialized_ = std::max(initialized_, filled_ + n);
}

void ReadBuf::advance(size_t n)
{
    assert(filled_ + n <= initialized_);
    filled_ += n;
}

}  // namespace asyncssl
