#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/broker_errors.hpp"
#include "store/request_store.hpp"

namespace pokeme::http {

// Transport-neutral view of one inbound call. The server fills it from the
// wire; tests build it directly.
struct HttpRequest {
    std::string method;
    std::string target;
    std::string origin;
    std::string body;
    bool body_oversized = false;  // declared length exceeded the cap, body not read
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    std::optional<std::string> header(const std::string& name) const;
};

using ShutdownCallback = std::function<void()>;

class ProtocolHandler {
public:
    explicit ProtocolHandler(store::RequestStore& store,
                             ShutdownCallback on_shutdown = nullptr);

    HttpResponse handle(const HttpRequest& request) const;

private:
    HttpResponse handle_get(const std::string& path, const std::string& origin) const;
    HttpResponse handle_post(const std::string& path, const HttpRequest& request) const;
    HttpResponse handle_preflight(const std::string& origin) const;

    HttpResponse ask(const HttpRequest& request) const;
    HttpResponse answer(const HttpRequest& request) const;
    HttpResponse status(const std::string& id, const std::string& origin) const;
    HttpResponse shutdown(const std::string& origin) const;

    std::optional<nlohmann::json> read_json(const HttpRequest& request) const;

    static HttpResponse json_response(int status, const nlohmann::json& payload,
                                      const std::string& origin);
    static HttpResponse error_response(const core::errors::BrokerError& error,
                                       const std::string& origin);
    static void apply_origin(HttpResponse& response, const std::string& origin);

    store::RequestStore& store_;
    ShutdownCallback on_shutdown_;
};

}  // namespace pokeme::http
