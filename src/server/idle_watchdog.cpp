#include "server/idle_watchdog.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace pokeme::server {

IdleWatchdog::IdleWatchdog(PendingProbe has_pending, IdleCallback on_idle,
                           std::chrono::milliseconds interval,
                           std::chrono::milliseconds idle_timeout)
    : has_pending_(std::move(has_pending)),
      on_idle_(std::move(on_idle)),
      interval_(interval),
      idle_timeout_(idle_timeout) {}

IdleWatchdog::~IdleWatchdog() {
    stop();
}

void IdleWatchdog::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopping_ = false;
    thread_ = std::thread(&IdleWatchdog::loop, this);
}

void IdleWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool IdleWatchdog::fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void IdleWatchdog::loop() {
    auto last_active = std::chrono::steady_clock::now();
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
                return;
            }
        }

        const auto now = std::chrono::steady_clock::now();
        if (has_pending_()) {
            last_active = now;
            continue;
        }
        if (now - last_active <= idle_timeout_) {
            continue;
        }

        POKEME_LOG_INFO("IdleWatchdog: no pending requests for " +
                        std::to_string(idle_timeout_.count()) + " ms, shutting down");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fired_ = true;
        }
        on_idle_();
        return;
    }
}

}  // namespace pokeme::server
