#pragma once

#include <functional>
#include <utility>

namespace dlmanager {

// Move-only token; destroying or resetting it detaches the handler it guards.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::exchange(other.cancel_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::exchange(cancel_, nullptr);
            cancel();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

} // namespace dlmanager
