#include "dcmx/gateway/gateway_server.hpp"
#include "network/messages.hpp"
#include "utils/logger.hpp"

#include <httplib.h>

#include <nlohmann/json.hpp>

namespace dcmx {
namespace gateway {

// Wrapper for httplib::Server to avoid exposing it in public header
class GatewayServer::HttpServerImpl {
public:
    httplib::Server server;
};

namespace {

bool path_matches_pattern(const std::string& path, const std::string& pattern) {
    if (pattern == "*" || pattern == "/*") {
        return true;
    }

    if (pattern.find('*') == std::string::npos) {
        return path == pattern;
    }

    // Trailing wildcard: prefix match
    if (pattern.back() == '*') {
        std::string prefix = pattern.substr(0, pattern.size() - 1);
        return path.compare(0, prefix.size(), prefix) == 0;
    }

    return path == pattern;
}

HttpRequest translate_request(HttpMethod method, const httplib::Request& req) {
    HttpRequest request;
    request.method = method;
    request.path = req.path;
    request.client_ip = req.remote_addr;
    request.body.assign(req.body.begin(), req.body.end());
    for (const auto& [key, value] : req.headers) {
        request.headers[key] = value;
    }
    for (const auto& [key, value] : req.params) {
        request.query_params[key] = value;
    }
    return request;
}

void write_response(const HttpResponse& response, httplib::Response& res) {
    res.status = static_cast<int>(response.status);

    std::string content_type = "application/octet-stream";
    for (const auto& [key, value] : response.headers) {
        if (key == "Content-Type") {
            content_type = value;
        } else {
            res.set_header(key, value);
        }
    }

    std::string body_str(response.body.begin(), response.body.end());
    res.set_content(body_str, content_type);
}

} // anonymous namespace

const char* method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        default: return "UNKNOWN";
    }
}

HttpResponse HttpResponse::error(HttpStatus status, const std::string& message) {
    HttpResponse response;
    response.status = status;
    response.set_json_body(network::ErrorResponse{message}.to_json().dump());
    return response;
}

GatewayServer::GatewayServer(const GatewayConfig& config)
    : config_(config)
{}

GatewayServer::~GatewayServer() {
    stop();
}

Result<void> GatewayServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
        DCMX_LOG_WARN("Gateway server already running");
        return Result<void>::Err(ErrorCode::ServiceAlreadyRunning,
            "gateway already running", config_.bind_address + ":" + std::to_string(bound_port_));
    }

    DCMX_LOG_INFO("Starting gateway server on {}:{}",
                  config_.bind_address, config_.http_port);

    // A fresh server per run; httplib servers are not restartable
    http_server_ = std::make_unique<HttpServerImpl>();
    auto& server = http_server_->server;
    server.set_payload_max_length(config_.max_request_body_size);
    server.set_read_timeout(static_cast<time_t>(config_.read_timeout.count()), 0);
    // SO_REUSEADDR only: an occupied port must fail the bind
    server.set_socket_options([](auto sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
    });
    setup_http_routes();

    int port = -1;
    if (config_.http_port == 0) {
        port = server.bind_to_any_port(config_.bind_address.c_str());
    } else if (server.bind_to_port(config_.bind_address.c_str(), config_.http_port)) {
        port = config_.http_port;
    }

    if (port <= 0) {
        DCMX_LOG_ERROR("Failed to bind to {}:{}", config_.bind_address, config_.http_port);
        http_server_.reset();
        return Result<void>::Err(ErrorCode::ServiceBindFailed, "cannot bind listening socket",
            config_.bind_address + ":" + std::to_string(config_.http_port));
    }

    bound_port_ = static_cast<uint16_t>(port);
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_ = Statistics{};
        stats_.started_at = std::chrono::system_clock::now();
    }
    running_ = true;

    server_thread_ = std::thread([this]() {
        DCMX_LOG_DEBUG("HTTP server thread starting");

        // Blocks until stop() is called
        if (!http_server_->server.listen_after_bind() && running_) {
            DCMX_LOG_ERROR("HTTP server on port {} stopped unexpectedly", bound_port_.load());
        }

        DCMX_LOG_DEBUG("HTTP server thread exiting");
    });

    // stop() only interrupts a server that has entered its accept loop
    for (int i = 0; i < 2000 && !server.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    DCMX_LOG_INFO("Gateway server listening on {}:{}", config_.bind_address, port);
    return Result<void>::Ok();
}

void GatewayServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!running_) {
        return;
    }

    DCMX_LOG_INFO("Stopping gateway server on port {}", bound_port_.load());
    running_ = false;

    // Unblocks listen_after_bind()
    http_server_->server.stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    http_server_.reset();
    bound_port_ = 0;

    DCMX_LOG_INFO("Gateway server stopped");
}

void GatewayServer::register_handler(
    HttpMethod method,
    const std::string& path_pattern,
    RequestHandler handler
) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    RouteKey key{method, path_pattern};
    handlers_[key] = std::move(handler);

    DCMX_LOG_DEBUG("Registered handler: {} {}",
                   method_to_string(method), path_pattern);
}

void GatewayServer::setup_http_routes() {
    auto& server = http_server_->server;

    server.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        write_response(handle_request(translate_request(HttpMethod::GET, req)), res);
    });

    server.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        write_response(handle_request(translate_request(HttpMethod::POST, req)), res);
    });

    // Anything httplib rejects before routing (unsupported method, bad request line)
    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            res.set_content(R"({"error": "Not found"})", "application/json");
        }
    });
}

HttpResponse GatewayServer::handle_request(const HttpRequest& request) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_requests++;
        stats_.bytes_received += request.body.size();
    }

    auto handler_opt = find_handler(request.method, request.path);
    if (!handler_opt) {
        DCMX_LOG_DEBUG("No handler for {} {}", method_to_string(request.method), request.path);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.not_found++;
        return HttpResponse::error(HttpStatus::NOT_FOUND, "Not found");
    }

    try {
        auto response = (*handler_opt)(request);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.bytes_sent += response.body.size();
        return response;
    } catch (const std::exception& e) {
        DCMX_LOG_ERROR("Handler error on {} {}: {}",
                       method_to_string(request.method), request.path, e.what());
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.handler_errors++;
        return HttpResponse::error(HttpStatus::INTERNAL_ERROR, "Internal server error");
    }
}

std::optional<RequestHandler> GatewayServer::find_handler(
    HttpMethod method,
    const std::string& path
) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);

    // Try exact match first
    RouteKey key{method, path};
    auto it = handlers_.find(key);
    if (it != handlers_.end()) {
        return it->second;
    }

    // Longest matching pattern wins
    const RequestHandler* best = nullptr;
    size_t best_length = 0;
    for (const auto& [route_key, handler] : handlers_) {
        if (route_key.method == method &&
            path_matches_pattern(path, route_key.path_pattern) &&
            (!best || route_key.path_pattern.size() > best_length)) {
            best = &handler;
            best_length = route_key.path_pattern.size();
        }
    }

    if (best) {
        return *best;
    }
    return std::nullopt;
}

GatewayServer::Statistics GatewayServer::get_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace gateway
} // namespace dcmx
