#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "headers.hpp"
#include "http_method.hpp"

namespace poolhttp {

    class Connection;
    struct PoolKey;

    /// @brief Fractional seconds, used for backoff and Retry-After values.
    using Seconds = std::chrono::duration<double>;

    /**
     * @brief Transport settings of a connection. Every field takes part in
     * the pool key: two requests whose options differ never share a
     * pooled connection.
     */
    struct ConnectionOptions {
        /** @brief Timeout for name resolution, TCP connect and handshakes. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Timeout for writing the request and reading the response. */
        std::chrono::milliseconds read_timeout{5000};

        /** @brief Whether to verify the peer certificate and host name. */
        bool verify_tls{true};

        /** @brief CA bundle file; system defaults are used when unset. */
        std::optional<std::string> ca_file;

        /** @brief CA directory (hashed, as for c_rehash). */
        std::optional<std::string> ca_path;

        /** @brief Client certificate chain (PEM). */
        std::optional<std::string> cert_file;

        /** @brief Private key for cert_file (PEM). */
        std::optional<std::string> key_file;

        /** @brief Name sent as SNI and checked against the certificate,
         * instead of the URL host. */
        std::optional<std::string> server_hostname;

        /** @brief Forward proxy (http://host:port). https origins are
         * tunnelled through CONNECT. */
        std::optional<std::string> proxy_url;

        /** @brief Disable Nagle on the socket. */
        bool tcp_nodelay{true};

        /** @brief Read buffer size in bytes. */
        std::size_t blocksize{16384};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U *
                                   1024U};

        friend bool operator==(const ConnectionOptions&,
                               const ConnectionOptions&) = default;
    };

    /**
     * @brief Per-origin pool settings.
     */
    struct PoolConfiguration {
        /** @brief Maximum number of connections per origin. */
        std::size_t maxsize{1};

        /** @brief Wait for a release instead of failing when the pool is
         * at capacity. */
        bool block{false};

        /** @brief How long a blocking acquire waits; unset waits forever. */
        std::optional<std::chrono::milliseconds> pool_timeout;

        /** @brief Idle connection time-to-live (0 disables the check). */
        std::chrono::milliseconds connection_idle_ttl{0};

        /** @brief Max lifetime of any single connection (0 disables). */
        std::chrono::seconds max_connection_age{0};
    };

    /**
     * @brief Budgets and knobs of the retry policy. A budget left unset is
     * unlimited.
     */
    struct RetryConfiguration {
        std::optional<int> total{10};
        std::optional<int> connect;
        std::optional<int> read;
        std::optional<int> redirect;
        std::optional<int> status;
        std::optional<int> other;

        /** @brief Set by Retry::disabled(): errors are returned unwrapped
         * and redirects are handed back instead of followed. */
        bool disabled{false};

        /** @brief Methods that may be retried after a read error or a
         * forced status; unset allows every method. */
        std::optional<std::set<HttpMethod>> allowed_methods{
            std::set<HttpMethod>{HttpMethod::Head, HttpMethod::Get,
                                 HttpMethod::Put, HttpMethod::Delete,
                                 HttpMethod::Options, HttpMethod::Trace}};

        /** @brief Statuses that force a retry. */
        std::set<int> status_forcelist;

        double backoff_factor{0.0};
        Seconds backoff_max{120.0};
        /** @brief Upper bound of the uniform jitter added to backoff. */
        double backoff_jitter{0.0};

        bool raise_on_redirect{true};
        bool raise_on_status{true};
        bool respect_retry_after_header{true};
        Seconds retry_after_max{21600.0};

        /** @brief Headers dropped when a redirect leaves the origin
         * (lower-case). */
        std::set<std::string> remove_headers_on_redirect{
            "cookie", "authorization", "proxy-authorization"};
    };

    /** @brief Connection implementation used by new pools. */
    enum class ConnectionBackend {
        Beast,  /**< Boost.Beast over TCP/TLS (TcpConnection). */
        Custom  /**< ClientConfiguration::connection_factory. */
    };

    /// @brief Creates an unconnected Connection for one pool key.
    using ConnectionFactory =
        std::function<std::unique_ptr<Connection>(const PoolKey&)>;

    /**
     * @brief Configuration for HttpClient and PoolManager.
     */
    struct ClientConfiguration {
        /** @brief Optional base URL for the client. */
        std::optional<std::string> base_url;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"poolhttp/1.0"};

        /** @brief Default headers to include in every request. */
        Headers default_headers;

        ConnectionOptions connection;
        PoolConfiguration pool;

        /** @brief Maximum number of per-origin pools kept alive. */
        std::size_t num_pools{10};

        /** @brief Default retry policy for requests without their own. */
        RetryConfiguration retry;

        /** @brief Follow redirects by default. */
        bool redirect{true};

        ConnectionBackend backend{ConnectionBackend::Beast};

        /** @brief Used when backend is ConnectionBackend::Custom. */
        ConnectionFactory connection_factory;
    };

}  // namespace poolhttp
