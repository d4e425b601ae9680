#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include "client/broker_api.hpp"

namespace pokeme::client {

// BrokerApi over HTTP on 127.0.0.1. Every call opens a fresh connection.
class BrokerClient : public BrokerApi {
public:
    explicit BrokerClient(std::uint16_t port,
                          std::chrono::milliseconds io_timeout = std::chrono::seconds(5));

    std::string base_url() const;

    bool health() override;
    core::errors::Result<std::string> submit(const protocol::NewRequest& request) override;
    core::errors::Result<protocol::Request> fetch_status(const std::string& id) override;
    core::errors::Result<std::vector<protocol::Request>> fetch_pending() override;
    core::errors::Result<bool> submit_answer(const std::string& id,
                                             const std::string& answer) override;
    core::errors::Result<bool> request_shutdown() override;

private:
    struct Reply {
        int status = 0;
        std::string body;
    };

    core::errors::Result<Reply> exchange(boost::beast::http::verb method,
                                         const std::string& target,
                                         const std::string& body) const;

    core::errors::Result<nlohmann::json> call(boost::beast::http::verb method,
                                              const std::string& target,
                                              const std::string& body = "") const;

    std::uint16_t port_;
    std::chrono::milliseconds io_timeout_;
};

}  // namespace pokeme::client
