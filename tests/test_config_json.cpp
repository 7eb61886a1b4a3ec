#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <string>

#include "poolhttp/config_json.hpp"

using namespace poolhttp;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(ConfigJsonTest, EmptyObjectGivesDefaults) {
    ClientConfiguration cfg = load_client_configuration(json::object());
    ClientConfiguration defaults;

    EXPECT_FALSE(cfg.base_url.has_value());
    EXPECT_EQ(cfg.user_agent, defaults.user_agent);
    EXPECT_EQ(cfg.num_pools, defaults.num_pools);
    EXPECT_TRUE(cfg.redirect);
    EXPECT_EQ(cfg.connection, defaults.connection);
    EXPECT_EQ(cfg.pool.maxsize, 1U);
    EXPECT_EQ(cfg.retry.total, 10);
    EXPECT_EQ(cfg.backend, ConnectionBackend::Beast);
}

TEST(ConfigJsonTest, ReadsEverySection) {
    auto j = json::parse(R"({
        "base_url": "https://api.example.com/v1",
        "user_agent": "svc/2.0",
        "num_pools": 4,
        "redirect": false,
        "default_headers": {"Accept": "application/json"},
        "connection": {
            "connect_timeout_ms": 1500,
            "read_timeout_ms": 30000,
            "verify_tls": false,
            "ca_file": "/etc/ssl/ca.pem",
            "server_hostname": "internal.example",
            "proxy_url": "http://proxy:3128",
            "tcp_nodelay": false,
            "blocksize": 8192,
            "max_body_bytes": 1048576
        },
        "pool": {
            "maxsize": 8,
            "block": true,
            "pool_timeout_ms": 250,
            "connection_idle_ttl_ms": 60000,
            "max_connection_age_ms": 300000
        },
        "retry": {
            "total": 5,
            "connect": 2,
            "read": null,
            "status_forcelist": [502, 503],
            "allowed_methods": ["get", "POST"],
            "backoff_factor": 0.5,
            "backoff_max": 10,
            "raise_on_status": false,
            "retry_after_max": 60,
            "remove_headers_on_redirect": ["Authorization", "X-Api-Key"]
        }
    })");

    ClientConfiguration cfg = load_client_configuration(j);

    EXPECT_EQ(cfg.base_url, "https://api.example.com/v1");
    EXPECT_EQ(cfg.user_agent, "svc/2.0");
    EXPECT_EQ(cfg.num_pools, 4U);
    EXPECT_FALSE(cfg.redirect);
    ASSERT_EQ(cfg.default_headers.size(), 1U);
    EXPECT_EQ(cfg.default_headers[0].first, "Accept");
    EXPECT_EQ(cfg.default_headers[0].second, "application/json");

    EXPECT_EQ(cfg.connection.connect_timeout, 1500ms);
    EXPECT_EQ(cfg.connection.read_timeout, 30s);
    EXPECT_FALSE(cfg.connection.verify_tls);
    EXPECT_EQ(cfg.connection.ca_file, "/etc/ssl/ca.pem");
    EXPECT_FALSE(cfg.connection.ca_path.has_value());
    EXPECT_EQ(cfg.connection.server_hostname, "internal.example");
    EXPECT_EQ(cfg.connection.proxy_url, "http://proxy:3128");
    EXPECT_FALSE(cfg.connection.tcp_nodelay);
    EXPECT_EQ(cfg.connection.blocksize, 8192U);
    EXPECT_EQ(cfg.connection.max_body_bytes, 1048576U);

    EXPECT_EQ(cfg.pool.maxsize, 8U);
    EXPECT_TRUE(cfg.pool.block);
    EXPECT_EQ(cfg.pool.pool_timeout, 250ms);
    EXPECT_EQ(cfg.pool.connection_idle_ttl, 60s);
    EXPECT_EQ(cfg.pool.max_connection_age, 300s);

    EXPECT_EQ(cfg.retry.total, 5);
    EXPECT_EQ(cfg.retry.connect, 2);
    EXPECT_FALSE(cfg.retry.read.has_value());
    EXPECT_EQ(cfg.retry.status_forcelist, (std::set<int>{502, 503}));
    ASSERT_TRUE(cfg.retry.allowed_methods.has_value());
    EXPECT_EQ(*cfg.retry.allowed_methods,
              (std::set<HttpMethod>{HttpMethod::Get, HttpMethod::Post}));
    EXPECT_DOUBLE_EQ(cfg.retry.backoff_factor, 0.5);
    EXPECT_DOUBLE_EQ(cfg.retry.backoff_max.count(), 10.0);
    EXPECT_FALSE(cfg.retry.raise_on_status);
    EXPECT_TRUE(cfg.retry.raise_on_redirect);
    EXPECT_DOUBLE_EQ(cfg.retry.retry_after_max.count(), 60.0);
    EXPECT_EQ(cfg.retry.remove_headers_on_redirect,
              (std::set<std::string>{"authorization", "x-api-key"}));
}

TEST(ConfigJsonTest, TotalFalseDisablesRetries) {
    auto cfg = load_client_configuration(
        json::parse(R"({"retry": {"total": false, "redirect": 5}})"));
    EXPECT_TRUE(cfg.retry.disabled);
    EXPECT_EQ(cfg.retry.total, 0);
    EXPECT_EQ(cfg.retry.redirect, 0);
    EXPECT_FALSE(cfg.retry.raise_on_redirect);
}

TEST(ConfigJsonTest, NullTotalIsUnlimitedAndNullMethodsAllowAll) {
    auto cfg = load_client_configuration(json::parse(
        R"({"retry": {"total": null, "allowed_methods": null},
            "pool": {"pool_timeout_ms": null}})"));
    EXPECT_FALSE(cfg.retry.total.has_value());
    EXPECT_FALSE(cfg.retry.allowed_methods.has_value());
    EXPECT_FALSE(cfg.pool.pool_timeout.has_value());
}

TEST(ConfigJsonTest, BackendNameIsCaseInsensitive) {
    auto cfg =
        load_client_configuration(json::parse(R"({"backend": "Custom"})"));
    EXPECT_EQ(cfg.backend, ConnectionBackend::Custom);
}

TEST(ConfigJsonTest, RejectsMalformedValues) {
    EXPECT_THROW(load_client_configuration(json::array()),
                 std::invalid_argument);
    EXPECT_THROW(load_client_configuration(json::parse(R"({"num_pools": 0})")),
                 std::invalid_argument);
    EXPECT_THROW(
        load_client_configuration(json::parse(R"({"pool": {"maxsize": 0}})")),
        std::invalid_argument);
    EXPECT_THROW(load_client_configuration(json::parse(
                     R"({"connection": {"read_timeout_ms": -1}})")),
                 std::invalid_argument);
    EXPECT_THROW(load_client_configuration(
                     json::parse(R"({"retry": {"total": true}})")),
                 std::invalid_argument);
    EXPECT_THROW(load_client_configuration(json::parse(
                     R"({"retry": {"allowed_methods": ["FETCH"]}})")),
                 std::invalid_argument);
    EXPECT_THROW(load_client_configuration(json::parse(
                     R"({"retry": {"backoff_factor": -0.1}})")),
                 std::invalid_argument);
    EXPECT_THROW(load_client_configuration(
                     json::parse(R"({"default_headers": {"X-N": 1}})")),
                 std::invalid_argument);
    EXPECT_THROW(
        load_client_configuration(json::parse(R"({"backend": "curl"})")),
        std::invalid_argument);
    EXPECT_THROW(load_client_configuration(json::parse(R"({"pool": []})")),
                 std::invalid_argument);
}

TEST(ConfigJsonTest, ErrorMessageNamesTheKey) {
    try {
        (void)load_client_configuration(
            json::parse(R"({"redirect": "yes"})"));
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("'redirect'"), std::string::npos);
    }
}
