#include <asyncssl/future.hpp>

namespace asyncssl {

Sequence::Sequence(std::vector<Step> steps)
    : steps_{std::move(steps)}, next_{0}
{
}

auto Sequence::poll(Context& cx) -> Poll<void>
{
    while (true) {
        if (!current_) {
            if (next_ == steps_.size()) {
                return ready();
            }
            current_ = steps_[next_++]();
        }

        if (current_->poll(cx).isPending()) {
            return Pending{};
        }
        current_.reset();
    }
}

auto sequence(std::vector<Step> steps) -> FuturePtr<void>
{
    return std::make_unique<Sequence>(std::move(steps));
}

}  // namespace asyncssl
