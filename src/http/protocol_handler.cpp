#include "http/protocol_handler.hpp"

#include <cctype>
#include "core/logging/logger.hpp"
#include "http/origin_policy.hpp"
#include "protocol/request_json.hpp"

namespace pokeme::http {

using core::errors::BrokerError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kStatusPrefix = "/api/status/";

std::string strip_query(const std::string& target) {
    const auto pos = target.find('?');
    return pos == std::string::npos ? target : target.substr(0, pos);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

BrokerError route_not_found() {
    return BrokerError{ErrorCategory::NotFound, "not found", "route_not_found"};
}

}  // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (const auto& entry : headers) {
        if (iequals(entry.first, name)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

ProtocolHandler::ProtocolHandler(store::RequestStore& store,
                                 ShutdownCallback on_shutdown)
    : store_(store), on_shutdown_(std::move(on_shutdown)) {}

HttpResponse ProtocolHandler::handle(const HttpRequest& request) const {
    const std::string path = strip_query(request.target);
    POKEME_LOG_DEBUG("ProtocolHandler: " + request.method + " " + path);

    if (request.method == "GET") {
        return handle_get(path, request.origin);
    }
    if (request.method == "POST") {
        return handle_post(path, request);
    }
    if (request.method == "OPTIONS") {
        return handle_preflight(request.origin);
    }
    return error_response(route_not_found(), request.origin);
}

HttpResponse ProtocolHandler::handle_get(const std::string& path,
                                         const std::string& origin) const {
    if (path == "/api/pending") {
        json items = json::array();
        for (const auto& request : store_.pending()) {
            items.push_back(protocol::request_to_json(request));
        }
        return json_response(200, items, origin);
    }
    if (path.compare(0, std::char_traits<char>::length(kStatusPrefix), kStatusPrefix) == 0) {
        return status(path.substr(std::char_traits<char>::length(kStatusPrefix)), origin);
    }
    if (path == "/api/health") {
        return json_response(200, json{{"status", "ok"}}, origin);
    }
    return error_response(route_not_found(), origin);
}

HttpResponse ProtocolHandler::handle_post(const std::string& path,
                                          const HttpRequest& request) const {
    if (path == "/api/ask") {
        return ask(request);
    }
    if (path == "/api/answer") {
        return answer(request);
    }
    if (path == "/api/shutdown") {
        return shutdown(request.origin);
    }
    return error_response(route_not_found(), request.origin);
}

HttpResponse ProtocolHandler::handle_preflight(const std::string& origin) const {
    HttpResponse response;
    response.status = 204;
    response.content_type.clear();
    apply_origin(response, origin);
    response.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type");
    return response;
}

HttpResponse ProtocolHandler::ask(const HttpRequest& request) const {
    const auto body = read_json(request);
    if (!body.has_value()) {
        return error_response(
            BrokerError{ErrorCategory::Validation, "missing question", "missing_question"},
            request.origin);
    }

    auto parsed = protocol::parse_ask_body(body.value());
    if (core::errors::is_error(parsed)) {
        return error_response(core::errors::get_error(parsed), request.origin);
    }

    auto created = store_.create(core::errors::get_value(parsed));
    if (core::errors::is_error(created)) {
        return error_response(core::errors::get_error(created), request.origin);
    }
    return json_response(200, json{{"id", core::errors::get_value(created).id}},
                         request.origin);
}

HttpResponse ProtocolHandler::answer(const HttpRequest& request) const {
    const auto body = read_json(request);
    if (!body.has_value()) {
        return error_response(
            BrokerError{ErrorCategory::Validation, "missing id or answer", "missing_fields"},
            request.origin);
    }

    auto parsed = protocol::parse_answer_body(body.value());
    if (core::errors::is_error(parsed)) {
        return error_response(core::errors::get_error(parsed), request.origin);
    }

    const auto& fields = core::errors::get_value(parsed);
    if (!store_.answer(fields.id, fields.answer)) {
        return error_response(BrokerError{ErrorCategory::NotFound,
                                          "request not found or already answered",
                                          "answer_rejected"},
                              request.origin);
    }
    return json_response(200, json{{"status", "ok"}}, request.origin);
}

HttpResponse ProtocolHandler::status(const std::string& id,
                                     const std::string& origin) const {
    const auto request = store_.get(id);
    if (!request.has_value()) {
        return error_response(
            BrokerError{ErrorCategory::NotFound, "not found", "request_not_found"}, origin);
    }
    return json_response(200, protocol::request_to_json(request.value()), origin);
}

HttpResponse ProtocolHandler::shutdown(const std::string& origin) const {
    POKEME_LOG_INFO("ProtocolHandler: shutdown requested");
    if (on_shutdown_) {
        on_shutdown_();
    }
    return json_response(200, json{{"status", "shutting down"}}, origin);
}

std::optional<json> ProtocolHandler::read_json(const HttpRequest& request) const {
    if (request.body_oversized || request.body.empty() ||
        request.body.size() > store_.limits().max_body_bytes) {
        return std::nullopt;
    }

    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded()) {
        return std::nullopt;
    }
    return body;
}

HttpResponse ProtocolHandler::json_response(const int status, const json& payload,
                                            const std::string& origin) {
    HttpResponse response;
    response.status = status;
    response.body = payload.dump();
    apply_origin(response, origin);
    return response;
}

HttpResponse ProtocolHandler::error_response(const BrokerError& error,
                                             const std::string& origin) {
    return json_response(core::errors::http_status_for(error.category),
                         json{{"error", error.message}}, origin);
}

void ProtocolHandler::apply_origin(HttpResponse& response, const std::string& origin) {
    const auto allowed = allowed_origin(origin);
    if (allowed.has_value()) {
        response.headers.emplace_back("Access-Control-Allow-Origin", allowed.value());
    }
}

}  // namespace pokeme::http
