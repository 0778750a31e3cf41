#include "dlmanager/connectivity.hpp"

#include <utility>
#include <vector>

namespace dlmanager {

ManualConnectivityMonitor::ManualConnectivityMonitor() : state_(std::make_shared<State>()) {}

Subscription ManualConnectivityMonitor::subscribe(Handler handler) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        id = state_->next_id++;
        state_->handlers.emplace(id, std::make_shared<Handler>(std::move(handler)));
    }

    std::weak_ptr<State> weak = state_;
    return Subscription([weak, id]() {
        if (auto state = weak.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->handlers.erase(id);
        }
    });
}

ConnectivityStatus ManualConnectivityMonitor::current() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->status;
}

void ManualConnectivityMonitor::update(const ConnectivityStatus& status) {
    std::vector<std::shared_ptr<Handler>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->status = status;
        for (const auto& entry : state_->handlers) {
            targets.push_back(entry.second);
        }
    }
    for (const auto& handler : targets) {
        (*handler)(status);
    }
}

} // namespace dlmanager
