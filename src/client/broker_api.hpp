#pragma once

#include <string>
#include <vector>
#include "core/errors/broker_errors.hpp"
#include "protocol/request.hpp"

namespace pokeme::client {

// Caller-side view of a running broker.
class BrokerApi {
public:
    virtual ~BrokerApi() = default;

    virtual bool health() = 0;
    virtual core::errors::Result<std::string> submit(const protocol::NewRequest& request) = 0;
    virtual core::errors::Result<protocol::Request> fetch_status(const std::string& id) = 0;
    virtual core::errors::Result<std::vector<protocol::Request>> fetch_pending() = 0;
    virtual core::errors::Result<bool> submit_answer(const std::string& id,
                                                     const std::string& answer) = 0;
    virtual core::errors::Result<bool> request_shutdown() = 0;
};

}  // namespace pokeme::client
