#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace pokeme::server {

// Wakes every `interval`; once the store has reported no pending work for
// longer than `idle_timeout`, calls `on_idle` once and exits.
class IdleWatchdog {
public:
    using PendingProbe = std::function<bool()>;
    using IdleCallback = std::function<void()>;

    IdleWatchdog(PendingProbe has_pending, IdleCallback on_idle,
                 std::chrono::milliseconds interval,
                 std::chrono::milliseconds idle_timeout);
    ~IdleWatchdog();

    IdleWatchdog(const IdleWatchdog&) = delete;
    IdleWatchdog& operator=(const IdleWatchdog&) = delete;

    void start();
    void stop();

    bool fired() const;

private:
    void loop();

    PendingProbe has_pending_;
    IdleCallback on_idle_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds idle_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    bool fired_ = false;
    std::thread thread_;
};

}  // namespace pokeme::server
