#include <gtest/gtest.h>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "http_test_server.hpp"
#include "poolhttp/connection/tcp_connection.hpp"
#include "poolhttp/endpoint.hpp"
#include "poolhttp/request.hpp"

using namespace poolhttp;
using namespace std::chrono_literals;

namespace {

    PoolKey local_key(uint16_t port, ConnectionOptions opts = {}) {
        PoolKey key;
        key.endpoint = Endpoint{"127.0.0.1", std::to_string(port), false};
        key.options = std::move(opts);
        return key;
    }

    PreparedRequest get_request(uint16_t port, const std::string& path) {
        auto url =
            parse_url("http://127.0.0.1:" + std::to_string(port) + path);
        Request req{HttpMethod::Get, {}, {}, std::nullopt};
        return prepare_request(req, url.value(), "poolhttp-test");
    }

}  // namespace

TEST(EndpointTest, ClearResetsFields) {
    Endpoint details{"example.com", "443", true};
    details.clear();
    EXPECT_EQ(details.host, "");
    EXPECT_EQ(details.port, "");
    EXPECT_FALSE(details.https);
}

TEST(EndpointTest, FromUrlNormalizesHostAndPort) {
    auto url = parse_url("HTTPS://Example.COM/path").value();
    Endpoint ep = endpoint_from_url(url);
    EXPECT_EQ(ep.host, "example.com");
    EXPECT_EQ(ep.port, "443");
    EXPECT_TRUE(ep.https);
    EXPECT_EQ(to_string(ep), "https://example.com:443");

    auto explicit_port = parse_url("https://example.com:443/").value();
    EXPECT_EQ(ep, endpoint_from_url(explicit_port));
}

TEST(TlsSetupTest, SetSniReturnsTrueOrFalse) {
    boost::asio::io_context ioc;
    boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_client);
    boost::beast::tcp_stream tcp(ioc);
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(std::move(tcp),
                                                              ctx);
    boost::system::error_code ec;
    bool result = set_sni(stream, "example.com", ec);
    EXPECT_TRUE(result || ec);
}

TEST(TlsSetupTest, InitOnSslContextDoesNotThrowWithDefaults) {
    boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_client);
    EXPECT_NO_THROW(init_tls_on_ssl_context(ctx, ConnectionOptions{}));
}

TEST(TlsSetupTest, MissingCaFileThrows) {
    boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_client);
    ConnectionOptions opts;
    opts.ca_file = "/nonexistent/poolhttp-ca.pem";
    EXPECT_THROW(init_tls_on_ssl_context(ctx, opts), std::runtime_error);
}

TEST(TlsSetupTest, ContextFailureIsRememberedAsHandshakeError) {
    TlsContext tls;
    ConnectionOptions opts;
    opts.ca_file = "/nonexistent/poolhttp-ca.pem";

    auto first = tls.get(opts);
    ASSERT_TRUE(first.has_error());
    EXPECT_EQ(first.error().code, ErrorCode::TlsHandshakeFailed);

    auto second = tls.get(opts);
    ASSERT_TRUE(second.has_error());
    EXPECT_EQ(second.error().message, first.error().message);
}

TEST(TcpConnectionTest, ExchangesAndStaysReusable) {
    poolhttp_test::HttpTestServer server(
        [](const auto& req, auto& res) {
            res.result(boost::beast::http::status::ok);
            res.body() = "path=" + std::string(req.target());
        },
        /*honor_keep_alive=*/true, 2s);

    TcpConnection conn(local_key(server.port()), nullptr);
    EXPECT_FALSE(conn.is_connected());

    auto r1 = conn.request(get_request(server.port(), "/a"));
    ASSERT_TRUE(r1.has_value()) << r1.error().message;
    EXPECT_EQ(r1.value().status_code, 200);
    EXPECT_EQ(r1.value().body, "path=/a");
    EXPECT_TRUE(r1.value().keep_alive);

    EXPECT_TRUE(conn.is_connected());
    EXPECT_TRUE(conn.is_reusable());
    EXPECT_FALSE(conn.is_dropped());
    EXPECT_FALSE(conn.is_verified());

    auto r2 = conn.request(get_request(server.port(), "/b"));
    ASSERT_TRUE(r2.has_value()) << r2.error().message;
    EXPECT_EQ(r2.value().body, "path=/b");

    conn.close();
    conn.close();
    EXPECT_FALSE(conn.is_connected());
    EXPECT_FALSE(conn.is_reusable());

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2U);
    EXPECT_EQ(seen[0][boost::beast::http::field::user_agent], "poolhttp-test");
}

TEST(TcpConnectionTest, DetectsPeerCloseWhileIdle) {
    poolhttp_test::HttpTestServer server(
        [](const auto&, auto& res) {
            res.result(boost::beast::http::status::no_content);
        },
        /*honor_keep_alive=*/true, 100ms);

    TcpConnection conn(local_key(server.port()), nullptr);
    auto r = conn.request(get_request(server.port(), "/"));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_FALSE(conn.is_dropped());

    std::this_thread::sleep_for(400ms);
    const Connection& view = conn;
    EXPECT_TRUE(view.is_connected());
    EXPECT_TRUE(view.is_dropped());

    // Reconnecting brings it back
    ASSERT_TRUE(conn.connect().has_value());
    EXPECT_FALSE(view.is_dropped());

    conn.close();
    EXPECT_FALSE(view.is_connected());
    EXPECT_FALSE(view.is_dropped());
}

TEST(TcpConnectionTest, ServerCloseMakesConnectionUnusable) {
    poolhttp_test::HttpTestServer server([](const auto&, auto& res) {
        res.result(boost::beast::http::status::ok);
        res.body() = "last";
    });

    TcpConnection conn(local_key(server.port()), nullptr);
    auto r = conn.request(get_request(server.port(), "/"));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_FALSE(r.value().keep_alive);
    EXPECT_FALSE(conn.is_reusable());
    EXPECT_FALSE(conn.is_connected());
}

TEST(TcpConnectionTest, RefusedConnectIsReported) {
    const auto port = poolhttp_test::unused_port();
    ConnectionOptions opts;
    opts.connect_timeout = 500ms;
    TcpConnection conn(local_key(port, opts), nullptr);

    auto c = conn.connect();
    ASSERT_TRUE(c.has_error());
    EXPECT_EQ(c.error().code, ErrorCode::ConnectionFailed);
    EXPECT_FALSE(conn.is_connected());
    EXPECT_FALSE(conn.is_reusable());

    // request() connects first and surfaces the same error
    auto r = conn.request(get_request(port, "/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionFailed);
}

TEST(TcpConnectionTest, OversizedBodyIsAProtocolError) {
    poolhttp_test::HttpTestServer server([](const auto&, auto& res) {
        res.result(boost::beast::http::status::ok);
        res.body() = std::string(64, 'x');
    });

    ConnectionOptions opts;
    opts.max_body_bytes = 16;
    TcpConnection conn(local_key(server.port(), opts), nullptr);

    auto r = conn.request(get_request(server.port(), "/big"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, ErrorCode::ProtocolError);
    EXPECT_FALSE(conn.is_connected());
}

TEST(TcpConnectionTest, FactoryBuildsUnconnectedConnections) {
    auto factory = make_tcp_connection_factory();
    auto key = local_key(80);
    auto conn = factory(key);
    ASSERT_NE(conn, nullptr);
    EXPECT_FALSE(conn->is_connected());
    EXPECT_EQ(conn->endpoint(), key.endpoint);
}
