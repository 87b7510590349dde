#include "dcmx/gateway/gateway_server.hpp"
#include "dcmx/common.hpp"
#include "network/messages.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace dcmx;
using namespace dcmx::gateway;
using json = nlohmann::json;

class GatewayTest : public ::testing::Test {
protected:
    GatewayConfig config;

    void SetUp() override {
        config.bind_address = "127.0.0.1";
        config.http_port = 0;
    }

    static HttpRequest make_request(HttpMethod method, const std::string& path) {
        HttpRequest request;
        request.method = method;
        request.path = path;
        return request;
    }

    static std::string body_of(const HttpResponse& response) {
        return std::string(response.body.begin(), response.body.end());
    }
};

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(GatewayTest, ExactRouteDispatch) {
    GatewayServer server(config);
    server.register_handler(HttpMethod::GET, "/ping", [](const HttpRequest&) {
        HttpResponse res;
        res.set_json_body(R"({"status":"ok"})");
        return res;
    });

    auto response = server.handle_request(make_request(HttpMethod::GET, "/ping"));
    EXPECT_EQ(response.status, HttpStatus::OK);
    EXPECT_EQ(body_of(response), R"({"status":"ok"})");
}

TEST_F(GatewayTest, MethodIsPartOfRoute) {
    GatewayServer server(config);
    server.register_handler(HttpMethod::POST, "/discover", [](const HttpRequest&) {
        return HttpResponse();
    });

    auto response = server.handle_request(make_request(HttpMethod::GET, "/discover"));
    EXPECT_EQ(response.status, HttpStatus::NOT_FOUND);
}

TEST_F(GatewayTest, UnknownRouteIsJson404) {
    GatewayServer server(config);

    auto response = server.handle_request(make_request(HttpMethod::GET, "/nowhere"));
    EXPECT_EQ(response.status, HttpStatus::NOT_FOUND);
    EXPECT_EQ(json::parse(body_of(response)), (json{{"error", "Not found"}}));
    EXPECT_EQ(server.get_statistics().not_found, 1u);
}

TEST_F(GatewayTest, WildcardPrefixRoute) {
    GatewayServer server(config);
    server.register_handler(HttpMethod::GET, "/content/*", [](const HttpRequest& req) {
        HttpResponse res;
        res.set_binary_body(to_bytes(req.path.substr(9)), "application/octet-stream");
        return res;
    });

    auto response = server.handle_request(make_request(HttpMethod::GET, "/content/abcdef"));
    EXPECT_EQ(response.status, HttpStatus::OK);
    EXPECT_EQ(body_of(response), "abcdef");
    EXPECT_EQ(response.headers["Content-Type"], "application/octet-stream");

    EXPECT_EQ(server.handle_request(make_request(HttpMethod::GET, "/contents")).status,
              HttpStatus::NOT_FOUND);
}

TEST_F(GatewayTest, ThrowingHandlerIs500) {
    GatewayServer server(config);
    server.register_handler(HttpMethod::GET, "/boom", [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("handler failure");
    });

    auto response = server.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status, HttpStatus::INTERNAL_ERROR);
    EXPECT_TRUE(json::parse(body_of(response)).contains("error"));
    EXPECT_EQ(server.get_statistics().handler_errors, 1u);
}

TEST_F(GatewayTest, ErrorHelper) {
    auto response = HttpResponse::error(HttpStatus::BAD_REQUEST, "Invalid content hash");
    EXPECT_EQ(response.status, HttpStatus::BAD_REQUEST);
    EXPECT_EQ(json::parse(body_of(response))["error"], "Invalid content hash");

    auto parsed = network::ErrorResponse::from_json(json::parse(body_of(response)));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().error, "Invalid content hash");
}

// ============================================================================
// Lifecycle over real sockets
// ============================================================================

TEST_F(GatewayTest, StartServeStop) {
    GatewayServer server(config);
    server.register_handler(HttpMethod::POST, "/echo", [](const HttpRequest& req) {
        HttpResponse res;
        res.set_json_body(req.body_string());
        return res;
    });

    ASSERT_TRUE(server.start().is_ok());
    EXPECT_TRUE(server.is_running());
    const uint16_t port = server.port();
    ASSERT_NE(port, 0);

    httplib::Client client("127.0.0.1", port);
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(2, 0);

    auto echoed = client.Post("/echo", R"({"hello":"mesh"})", "application/json");
    ASSERT_TRUE(echoed);
    EXPECT_EQ(echoed->status, 200);
    EXPECT_EQ(json::parse(echoed->body)["hello"], "mesh");

    auto missing = client.Get("/missing");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(json::parse(missing->body)["error"], "Not found");

    server.stop();
    EXPECT_FALSE(server.is_running());
    EXPECT_EQ(server.port(), 0);

    // Socket released
    httplib::Client after("127.0.0.1", port);
    after.set_connection_timeout(1, 0);
    EXPECT_FALSE(after.Get("/missing"));
}

TEST_F(GatewayTest, StartTwiceFails) {
    GatewayServer server(config);
    ASSERT_TRUE(server.start().is_ok());

    auto second = server.start();
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.error().code(), ErrorCode::ServiceAlreadyRunning);

    server.stop();
}

TEST_F(GatewayTest, BindFailureLeavesServerStopped) {
    GatewayServer first(config);
    ASSERT_TRUE(first.start().is_ok());

    GatewayConfig clash = config;
    clash.http_port = first.port();
    GatewayServer second(clash);

    auto result = second.start();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ServiceBindFailed);
    EXPECT_FALSE(second.is_running());

    first.stop();
}

TEST_F(GatewayTest, RestartAfterStop) {
    GatewayServer server(config);
    server.register_handler(HttpMethod::GET, "/ping", [](const HttpRequest&) {
        return HttpResponse();
    });

    ASSERT_TRUE(server.start().is_ok());
    server.stop();
    server.stop();  // idempotent

    ASSERT_TRUE(server.start().is_ok());
    httplib::Client client("127.0.0.1", server.port());
    auto res = client.Get("/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    server.stop();
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
