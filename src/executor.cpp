#include <asyncssl/executor.hpp>

#include <deque>
#include <map>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

#include <asyncssl/exceptions.hpp>
#include <asyncssl/net/reactor.hpp>

namespace asyncssl {

struct LocalExecutor::State {
    std::map<size_t, FuturePtr<void>> tasks;
    std::deque<size_t> runQueue;
    std::set<size_t> queued;
    size_t nextId = 0;

    void schedule(size_t id)
    {
        if (queued.insert(id).second) {
            runQueue.push_back(id);
        }
    }
};

LocalExecutor::LocalExecutor(Reactor *reactor)
    : state_{std::make_shared<State>()}, reactor_{reactor}
{
}

LocalExecutor::~LocalExecutor() = default;

void LocalExecutor::spawn(FuturePtr<void> task)
{
    auto const id = state_->nextId++;
    state_->tasks.emplace(id, std::move(task));
    state_->schedule(id);
}

auto LocalExecutor::pendingTasks() const -> size_t
{
    return state_->tasks.size();
}

auto LocalExecutor::makeWaker(size_t id) const -> Waker
{
    std::weak_ptr<State> weak = state_;
    return Waker{[weak, id]() {
        if (auto const state = weak.lock()) {
            state->schedule(id);
        }
    }};
}

void LocalExecutor::run()
{
    auto& state = *state_;

    while (!state.tasks.empty()) {
        if (state.runQueue.empty()) {
            if (reactor_ != nullptr && reactor_->hasInterest()) {
                reactor_->wait();
                continue;
            }
            throw AsyncSslException{"executor stalled with " + std::to_string(state.tasks.size()) +
                                    " task(s) pending and nothing left to wake them"};
        }

        auto const id = state.runQueue.front();
        state.runQueue.pop_front();
        state.queued.erase(id);

        auto const iter = state.tasks.find(id);
        if (iter == std::end(state.tasks)) {
            continue;
        }

        Waker const waker = this->makeWaker(id);
        Context cx{waker};
        if (iter->second->poll(cx).isReady()) {
            spdlog::debug("Task {} completed", id);
            // releases everything the task owns, streams included
            state.tasks.erase(iter);
        }
    }
}

}  // namespace asyncssl
