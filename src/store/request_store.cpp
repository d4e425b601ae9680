#include "store/request_store.hpp"

#include <algorithm>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

namespace pokeme::store {

using core::errors::BrokerError;
using core::errors::ErrorCategory;
using core::text::truncate_chars;
using protocol::NewRequest;
using protocol::Request;
using protocol::RequestStatus;
using protocol::RequestType;

RequestStore::RequestStore(core::config::Limits limits, Clock clock)
    : limits_(std::move(limits)), clock_(std::move(clock)) {}

protocol::Timestamp RequestStore::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

core::errors::Result<Request> RequestStore::create(const NewRequest& request) {
    if (request.request_type == RequestType::Permission &&
        (!request.command.has_value() || request.command->empty())) {
        return BrokerError{ErrorCategory::Validation, "missing command",
                           "missing_command",
                           "Permission requests must include the command to approve."};
    }

    Request record;
    record.question = truncate_chars(request.question, limits_.max_question);
    record.context = truncate_chars(request.context, limits_.max_context);
    record.agent = truncate_chars(request.agent, limits_.max_agent);
    record.task = truncate_chars(request.task, limits_.max_task);
    record.request_type = request.request_type;
    record.command = truncate_chars(request.command, limits_.max_command);
    record.status = RequestStatus::Pending;

    std::size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto created_at = now();
        evicted = evict_stale_locked(created_at);

        if (pending_count_locked() < limits_.max_pending) {
            auto id = allocate_id_locked();
            if (!id.has_value()) {
                return BrokerError{ErrorCategory::Internal,
                                   "Unable to allocate unique request ID.",
                                   "request_id_generation_failed"};
            }
            record.id = std::move(id.value());
            record.created_at = created_at;
            requests_.emplace(record.id, record);
        }
    }

    if (evicted > 0) {
        POKEME_LOG_DEBUG("RequestStore: evicted " + std::to_string(evicted) +
                         " answered request(s)");
    }
    if (record.id.empty()) {
        POKEME_LOG_WARN("RequestStore: rejecting request, " +
                        std::to_string(limits_.max_pending) +
                        " requests already pending");
        return BrokerError{ErrorCategory::Backpressure, "too many pending requests",
                           "capacity_reached",
                           "Answer or abandon existing requests first."};
    }

    POKEME_LOG_INFO("RequestStore: created " + protocol::to_string(record.request_type) +
                    " " + record.id);
    return record;
}

std::optional<std::string> RequestStore::allocate_id_locked() {
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        std::string id = core::config::generate_request_id();
        if (issued_ids_.insert(id).second) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<Request> RequestStore::get(const std::string& id) const {
    if (!core::config::is_valid_request_id(id)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Request> RequestStore::pending() const {
    std::vector<Request> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : requests_) {
            if (entry.second.status == RequestStatus::Pending) {
                result.push_back(entry.second);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const Request& a, const Request& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    });
    return result;
}

bool RequestStore::answer(const std::string& id, const std::string& text) {
    if (!core::config::is_valid_request_id(id)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(id);
        if (it == requests_.end() || it->second.status != RequestStatus::Pending) {
            return false;
        }

        it->second.answer = truncate_chars(text, limits_.max_answer);
        it->second.answered_at = now();
        it->second.status = RequestStatus::Answered;
    }
    POKEME_LOG_INFO("RequestStore: " + id + " transition pending -> answered");
    return true;
}

bool RequestStore::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_count_locked() > 0;
}

std::size_t RequestStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::size_t RequestStore::pending_count_locked() const {
    return static_cast<std::size_t>(
        std::count_if(requests_.begin(), requests_.end(), [](const auto& entry) {
            return entry.second.status == RequestStatus::Pending;
        }));
}

std::size_t RequestStore::evict_stale_locked(const protocol::Timestamp now) {
    std::size_t evicted = 0;
    for (auto it = requests_.begin(); it != requests_.end();) {
        const Request& request = it->second;
        const bool stale = request.status == RequestStatus::Answered &&
                           request.answered_at.has_value() &&
                           now - request.answered_at.value() > limits_.answered_retention;
        if (!stale) {
            ++it;
            continue;
        }
        it = requests_.erase(it);
        ++evicted;
    }
    return evicted;
}

}  // namespace pokeme::store
