#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "core/config/broker_config.hpp"
#include "core/errors/broker_errors.hpp"
#include "http/protocol_handler.hpp"
#include "store/request_store.hpp"

namespace pokeme::server {

// Loopback HTTP front end for a RequestStore. One worker thread per accepted
// connection, one request per connection.
class BrokerServer {
public:
    BrokerServer(core::config::BrokerConfig config, store::RequestStore& store);

    BrokerServer(const BrokerServer&) = delete;
    BrokerServer& operator=(const BrokerServer&) = delete;

    // Opens the listening socket. Returns the bound port (useful when the
    // configured port is 0).
    core::errors::Result<std::uint16_t> bind();

    // Serves until request_shutdown() is called or the idle watchdog fires,
    // then waits for in-flight connections to finish.
    void run();

    // Thread-safe and idempotent.
    void request_shutdown();

    std::uint16_t port() const { return port_.load(); }

private:
    void do_accept();
    void serve_connection(boost::asio::ip::tcp::socket socket);
    void handle_connection(boost::asio::ip::tcp::socket& socket);
    void finish_connection();

    core::config::BrokerConfig config_;
    store::RequestStore& store_;
    http::ProtocolHandler handler_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<std::uint16_t> port_{0};
    std::atomic_bool shutting_down_{false};

    std::mutex connections_mutex_;
    std::condition_variable connections_done_;
    std::size_t active_connections_ = 0;
};

}  // namespace pokeme::server
