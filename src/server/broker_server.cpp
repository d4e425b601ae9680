#include "server/broker_server.hpp"

#include <string>
#include <thread>
#include <utility>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include "core/logging/logger.hpp"
#include "http/socket_io.hpp"
#include "server/idle_watchdog.hpp"

namespace pokeme::server {

namespace net = boost::asio;
namespace beast_http = boost::beast::http;
using core::errors::BrokerError;
using core::errors::ErrorCategory;
using tcp = net::ip::tcp;

using RequestParser = beast_http::request_parser<beast_http::string_body>;

BrokerServer::BrokerServer(core::config::BrokerConfig config, store::RequestStore& store)
    : config_(std::move(config)),
      store_(store),
      handler_(store_, [this] { request_shutdown(); }),
      acceptor_(ioc_) {}

core::errors::Result<std::uint16_t> BrokerServer::bind() {
    boost::system::error_code ec;
    const auto address = net::ip::make_address(config_.host, ec);
    if (ec || !address.is_loopback()) {
        return BrokerError{ErrorCategory::Internal,
                           "Refusing to bind non-loopback address: " + config_.host,
                           "bind_failed"};
    }

    const tcp::endpoint endpoint(address, config_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        return BrokerError{ErrorCategory::Internal,
                           "Failed to listen on " + config_.host + ":" +
                               std::to_string(config_.port) + ": " + ec.message(),
                           "bind_failed",
                           "Another broker may already be running on this port."};
    }

    const auto local = acceptor_.local_endpoint(ec);
    if (ec) {
        return BrokerError{ErrorCategory::Internal,
                           "Unable to read bound endpoint: " + ec.message(),
                           "bind_failed"};
    }
    port_ = local.port();
    POKEME_LOG_INFO("BrokerServer: listening on " + config_.host + ":" +
                    std::to_string(port_.load()));
    return port_.load();
}

void BrokerServer::run() {
    IdleWatchdog watchdog([this] { return store_.has_pending(); },
                          [this] { request_shutdown(); },
                          config_.watchdog_interval, config_.idle_timeout);
    watchdog.start();

    do_accept();
    ioc_.run();
    watchdog.stop();

    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_done_.wait(lock, [this] { return active_connections_ == 0; });
    POKEME_LOG_INFO("BrokerServer: stopped");
}

void BrokerServer::request_shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    POKEME_LOG_INFO("BrokerServer: shutdown requested");
    net::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

void BrokerServer::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            POKEME_LOG_WARN("BrokerServer: accept failed: " + ec.message());
            do_accept();
            return;
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            ++active_connections_;
        }
        std::thread(&BrokerServer::serve_connection, this, std::move(socket)).detach();
        do_accept();
    });
}

void BrokerServer::finish_connection() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    --active_connections_;
    connections_done_.notify_all();
}

void BrokerServer::serve_connection(tcp::socket socket) {
    {
        tcp::socket connection = std::move(socket);
        handle_connection(connection);
    }
    finish_connection();
}

void BrokerServer::handle_connection(tcp::socket& socket) {
    boost::system::error_code ec;
    socket.non_blocking(true, ec);

    boost::beast::flat_buffer buffer;
    RequestParser parser;
    // Beast rejects an oversized Content-Length while still in the header, so
    // the cap is applied only once the header is in.
    parser.body_limit(boost::none);

    ec = http::read_until(socket, buffer, parser, config_.socket_timeout,
                          [&parser] { return parser.is_header_done(); });
    if (ec) {
        POKEME_LOG_DEBUG("BrokerServer: dropping connection: " + ec.message());
        socket.close(ec);
        return;
    }

    http::HttpRequest request;
    const auto& header = parser.get();
    request.method = http::to_std_string(header.method_string());
    request.target = http::to_std_string(header.target());
    request.origin = http::to_std_string(header[beast_http::field::origin]);

    const auto declared = parser.content_length();
    if (declared && *declared > config_.limits.max_body_bytes) {
        request.body_oversized = true;
    } else {
        parser.body_limit(config_.limits.max_body_bytes);
        ec = http::read_until(socket, buffer, parser, config_.socket_timeout,
                              [&parser] { return parser.is_done(); });
        if (ec == beast_http::error::body_limit) {
            request.body_oversized = true;
        } else if (ec) {
            POKEME_LOG_DEBUG("BrokerServer: dropping connection: " + ec.message());
            socket.close(ec);
            return;
        } else {
            request.body = parser.get().body();
        }
    }

    const http::HttpResponse reply = handler_.handle(request);

    beast_http::response<beast_http::string_body> response{
        static_cast<beast_http::status>(reply.status), header.version()};
    response.set(beast_http::field::server, "pokeme");
    if (!reply.content_type.empty()) {
        response.set(beast_http::field::content_type, reply.content_type);
    }
    for (const auto& entry : reply.headers) {
        response.set(entry.first, entry.second);
    }
    response.keep_alive(false);
    response.body() = reply.body;
    response.prepare_payload();

    ec = http::write_message(socket, response, config_.socket_timeout);
    if (ec) {
        POKEME_LOG_DEBUG("BrokerServer: write failed: " + ec.message());
    }

    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

}  // namespace pokeme::server
