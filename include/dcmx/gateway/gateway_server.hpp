#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include <string>
#include <memory>
#include <unordered_map>
#include <functional>
#include <chrono>
#include <optional>
#include <thread>
#include <atomic>
#include <mutex>

namespace dcmx {
namespace gateway {

/**
 * HTTP request method types
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * HTTP status codes
 */
enum class HttpStatus {
    OK = 200,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    INTERNAL_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

/**
 * HTTP request representation
 */
struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string path;
    std::unordered_map<std::string, std::string> headers;
    std::unordered_map<std::string, std::string> query_params;
    bytes body;
    std::string client_ip;

    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

/**
 * HTTP response representation
 */
struct HttpResponse {
    HttpStatus status;
    std::unordered_map<std::string, std::string> headers;
    bytes body;

    HttpResponse() : status(HttpStatus::OK) {
        headers["Content-Type"] = "application/json";
        headers["Server"] = "DCMX-Node/" DCMX_VERSION_STRING;
    }

    void set_json_body(const std::string& json) {
        body.assign(json.begin(), json.end());
        headers["Content-Type"] = "application/json";
    }

    void set_binary_body(bytes data, const std::string& mime_type) {
        body = std::move(data);
        headers["Content-Type"] = mime_type;
    }

    /**
     * JSON error body {"error": message}
     */
    static HttpResponse error(HttpStatus status, const std::string& message);
};

/**
 * Request handler function type
 */
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * Gateway server configuration
 */
struct GatewayConfig {
    std::string bind_address{constants::DEFAULT_HOST};
    uint16_t http_port{constants::DEFAULT_PORT};     // 0 binds an ephemeral port

    size_t max_request_body_size{constants::MAX_MESSAGE_SIZE};
    std::chrono::seconds read_timeout{constants::DISCOVERY_TIMEOUT_SECONDS};
};

/**
 * HTTP front door of a node
 *
 * Owns a cpp-httplib server whose worker pool runs registered handlers.
 * Handlers are matched by method and path; a pattern ending in '*' matches
 * any path with that prefix. Unmatched requests get a JSON 404 and a
 * throwing handler turns into a JSON 500.
 */
class GatewayServer {
public:
    explicit GatewayServer(const GatewayConfig& config);

    ~GatewayServer();

    DCMX_DISALLOW_COPY_AND_MOVE(GatewayServer);

    /**
     * Bind the listening socket and start serving on a background thread
     *
     * Binding happens before this returns, so an occupied port is reported
     * here and leaves the server stopped.
     * @return ServiceAlreadyRunning or ServiceBindFailed on failure
     */
    Result<void> start();

    /**
     * Stop serving and release the socket; no-op when not running
     */
    void stop();

    /**
     * Check if server is running
     */
    bool is_running() const { return running_; }

    /**
     * Port actually bound (resolved when configured as 0); 0 when stopped
     */
    uint16_t port() const { return bound_port_; }

    const GatewayConfig& config() const { return config_; }

    /**
     * Register a request handler for a specific path pattern
     * @param method HTTP method
     * @param path_pattern Exact path, or prefix followed by '*'
     * @param handler Handler function
     */
    void register_handler(
        HttpMethod method,
        const std::string& path_pattern,
        RequestHandler handler
    );

    /**
     * Dispatch a request through the handler table
     *
     * This is what the HTTP layer calls for every request.
     */
    HttpResponse handle_request(const HttpRequest& request);

    /**
     * Get statistics
     */
    struct Statistics {
        size_t total_requests{0};
        size_t not_found{0};
        size_t handler_errors{0};
        size_t bytes_sent{0};
        size_t bytes_received{0};
        std::chrono::system_clock::time_point started_at;
    };

    Statistics get_statistics() const;

private:
    /**
     * Route every request of the HTTP layer into handle_request
     */
    void setup_http_routes();

    /**
     * Find matching handler for request
     */
    std::optional<RequestHandler> find_handler(HttpMethod method, const std::string& path) const;

    GatewayConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::thread server_thread_;
    std::mutex lifecycle_mutex_;

    // HTTP server (forward declared, defined in cpp)
    class HttpServerImpl;
    std::unique_ptr<HttpServerImpl> http_server_;

    // Request routing
    struct RouteKey {
        HttpMethod method;
        std::string path_pattern;

        bool operator==(const RouteKey& other) const {
            return method == other.method && path_pattern == other.path_pattern;
        }
    };

    struct RouteKeyHash {
        size_t operator()(const RouteKey& key) const {
            return std::hash<int>()(static_cast<int>(key.method)) ^
                   std::hash<std::string>()(key.path_pattern);
        }
    };

    mutable std::mutex handlers_mutex_;
    std::unordered_map<RouteKey, RequestHandler, RouteKeyHash> handlers_;

    // Statistics
    mutable std::mutex stats_mutex_;
    Statistics stats_;
};

const char* method_to_string(HttpMethod method);

} // namespace gateway
} // namespace dcmx
