#include "client/broker_client.hpp"

#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include "http/socket_io.hpp"
#include "protocol/request_json.hpp"

namespace pokeme::client {

namespace net = boost::asio;
namespace beast_http = boost::beast::http;
using core::errors::BrokerError;
using core::errors::ErrorCategory;
using nlohmann::json;
using tcp = net::ip::tcp;

BrokerClient::BrokerClient(std::uint16_t port, std::chrono::milliseconds io_timeout)
    : port_(port), io_timeout_(io_timeout) {}

std::string BrokerClient::base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

core::errors::Result<BrokerClient::Reply> BrokerClient::exchange(
    const beast_http::verb method, const std::string& target,
    const std::string& body) const {
    net::io_context ioc;
    tcp::socket socket(ioc);
    boost::system::error_code ec;

    const tcp::endpoint endpoint(net::ip::address_v4::loopback(), port_);
    socket.connect(endpoint, ec);
    if (ec) {
        return BrokerError{ErrorCategory::Transport,
                           "Cannot reach broker at " + base_url() + ": " + ec.message(),
                           "broker_unreachable",
                           "Start one with `pokeme serve`."};
    }

    beast_http::request<beast_http::string_body> request{method, target, 11};
    request.set(beast_http::field::host, "127.0.0.1:" + std::to_string(port_));
    request.set(beast_http::field::user_agent, "pokeme");
    request.set(beast_http::field::accept, "application/json");
    if (!body.empty()) {
        request.set(beast_http::field::content_type, "application/json");
    }
    request.keep_alive(false);
    request.body() = body;
    request.prepare_payload();

    socket.non_blocking(true, ec);
    ec = http::write_message(socket, request, io_timeout_);
    if (ec) {
        return BrokerError{ErrorCategory::Transport,
                           "Failed to send request to broker: " + ec.message(),
                           "broker_unreachable"};
    }

    boost::beast::flat_buffer buffer;
    beast_http::response_parser<beast_http::string_body> parser;
    ec = http::read_until(socket, buffer, parser, io_timeout_,
                          [&parser] { return parser.is_done(); });
    if (ec) {
        return BrokerError{ErrorCategory::Transport,
                           "Failed to read broker reply: " + ec.message(),
                           "bad_response"};
    }

    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);

    Reply reply;
    reply.status = static_cast<int>(parser.get().result_int());
    reply.body = parser.get().body();
    return reply;
}

core::errors::Result<json> BrokerClient::call(const beast_http::verb method,
                                              const std::string& target,
                                              const std::string& body) const {
    auto exchanged = exchange(method, target, body);
    if (core::errors::is_error(exchanged)) {
        return core::errors::get_error(exchanged);
    }
    const auto& reply = core::errors::get_value(exchanged);

    json payload = json::parse(reply.body, nullptr, false);
    if (reply.status >= 200 && reply.status < 300) {
        if (payload.is_discarded()) {
            return BrokerError{ErrorCategory::Transport,
                               "Broker reply is not valid JSON.", "bad_response"};
        }
        return payload;
    }

    std::string message = "HTTP " + std::to_string(reply.status);
    if (!payload.is_discarded() && payload.is_object()) {
        const auto it = payload.find("error");
        if (it != payload.end() && it->is_string()) {
            message = it->get<std::string>();
        }
    }
    const auto category = core::errors::category_for_http_status(reply.status);
    return BrokerError{category, message, "http_" + std::to_string(reply.status)};
}

bool BrokerClient::health() {
    auto result = call(beast_http::verb::get, "/api/health");
    if (core::errors::is_error(result)) {
        return false;
    }
    const auto& payload = core::errors::get_value(result);
    return payload.is_object() && payload.value("status", "") == "ok";
}

core::errors::Result<std::string> BrokerClient::submit(const protocol::NewRequest& request) {
    auto result = call(beast_http::verb::post, "/api/ask",
                       protocol::new_request_to_json(request).dump());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& payload = core::errors::get_value(result);
    const auto it = payload.find("id");
    if (!payload.is_object() || it == payload.end() || !it->is_string()) {
        return BrokerError{ErrorCategory::Transport, "Broker reply has no request id.",
                           "bad_response"};
    }
    return it->get<std::string>();
}

core::errors::Result<protocol::Request> BrokerClient::fetch_status(const std::string& id) {
    auto result = call(beast_http::verb::get, "/api/status/" + id);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return protocol::request_from_json(core::errors::get_value(result));
}

core::errors::Result<std::vector<protocol::Request>> BrokerClient::fetch_pending() {
    auto result = call(beast_http::verb::get, "/api/pending");
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& payload = core::errors::get_value(result);
    if (!payload.is_array()) {
        return BrokerError{ErrorCategory::Transport, "Pending list is not an array.",
                           "bad_response"};
    }

    std::vector<protocol::Request> requests;
    for (const auto& item : payload) {
        auto parsed = protocol::request_from_json(item);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        requests.push_back(core::errors::get_value(parsed));
    }
    return requests;
}

core::errors::Result<bool> BrokerClient::submit_answer(const std::string& id,
                                                       const std::string& answer) {
    json body;
    body["id"] = id;
    body["answer"] = answer;
    auto result = call(beast_http::verb::post, "/api/answer", body.dump());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return true;
}

core::errors::Result<bool> BrokerClient::request_shutdown() {
    auto result = call(beast_http::verb::post, "/api/shutdown");
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return true;
}

}  // namespace pokeme::client
