#pragma once

#include "subscription.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace dlmanager {

struct ConnectivityStatus {
    bool connected{true};
    bool cellular{false};
};

class ConnectivityMonitor {
public:
    using Handler = std::function<void(const ConnectivityStatus&)>;

    virtual ~ConnectivityMonitor() = default;

    [[nodiscard]] virtual Subscription subscribe(Handler handler) = 0;
    [[nodiscard]] virtual ConnectivityStatus current() const = 0;
};

// Monitor fed by its owner; used by the command line tool and the tests.
class ManualConnectivityMonitor final : public ConnectivityMonitor {
public:
    ManualConnectivityMonitor();

    [[nodiscard]] Subscription subscribe(Handler handler) override;
    [[nodiscard]] ConnectivityStatus current() const override;

    // Notifies subscribers synchronously on the calling thread, even when the
    // status did not change.
    void update(const ConnectivityStatus& status);

private:
    struct State {
        std::mutex mutex;
        ConnectivityStatus status;
        std::uint64_t next_id{1};
        std::map<std::uint64_t, std::shared_ptr<Handler>> handlers;
    };

    std::shared_ptr<State> state_;
};

} // namespace dlmanager
