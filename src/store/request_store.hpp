#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "core/config/broker_config.hpp"
#include "core/errors/broker_errors.hpp"
#include "protocol/request.hpp"

namespace pokeme::store {

using Clock = std::function<protocol::Timestamp()>;

// Owns every request the broker knows about. One mutex guards the whole map
// and each public operation holds it for its full duration.
class RequestStore {
public:
    explicit RequestStore(core::config::Limits limits = {}, Clock clock = nullptr);

    // Fails with Validation (permission without command) or Backpressure
    // (pending capacity reached). Runs the eviction sweep first.
    core::errors::Result<protocol::Request> create(const protocol::NewRequest& request);

    std::optional<protocol::Request> get(const std::string& id) const;

    // Snapshot of pending requests, oldest first.
    std::vector<protocol::Request> pending() const;

    // First answer wins. False for malformed, unknown or already answered ids.
    bool answer(const std::string& id, const std::string& text);

    bool has_pending() const;
    std::size_t size() const;

    const core::config::Limits& limits() const { return limits_; }

private:
    std::size_t evict_stale_locked(protocol::Timestamp now);
    std::size_t pending_count_locked() const;
    std::optional<std::string> allocate_id_locked();
    protocol::Timestamp now() const;

    core::config::Limits limits_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, protocol::Request> requests_;
    // Every id ever handed out, so evicted ids are never reused. Never pruned;
    // grows with total traffic for the life of the broker.
    std::unordered_set<std::string> issued_ids_;
};

}  // namespace pokeme::store
