#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

#include "../config.hpp"
#include "../url.hpp"
#include "connection.hpp"

namespace poolhttp {

    /**
     * @brief TLS context shared by the connections of one pool, built from
     * the pool's ConnectionOptions on first use.
     */
    class TlsContext {
       public:
        TlsContext() = default;

        TlsContext(const TlsContext&) = delete;
        TlsContext& operator=(const TlsContext&) = delete;

        /// @brief The context, or TlsHandshakeFailed if the configured
        /// trust store or client certificate could not be loaded.
        Result<boost::asio::ssl::context*> get(const ConnectionOptions& opts);

       private:
        std::mutex m_mu;
        std::optional<boost::asio::ssl::context> m_ctx;
        std::optional<Error> m_error;
    };

    /**
     * @brief Connection over Boost.Beast: TCP, optional proxy, optional TLS.
     *
     * Blocking from the caller's point of view. Each connection drives its
     * own io_context so that connect, handshake, write and read honour the
     * configured timeouts through beast::tcp_stream expiry.
     */
    class TcpConnection final : public Connection {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        TcpConnection(PoolKey key, std::shared_ptr<TlsContext> tls);

        ~TcpConnection() noexcept override;

        VoidResult connect() override;
        VoidResult send(const PreparedRequest& request) override;
        Result<Response> receive() override;

        bool is_connected() const noexcept override;
        bool is_dropped() const noexcept override;
        bool is_reusable() const noexcept override { return m_reusable; }
        bool is_verified() const noexcept override { return m_verified; }

        void close() noexcept override;

       private:
        /// @brief Close HTTP connection if open (best-effort).
        void close_http() noexcept;

        /// @brief Close HTTPS connection if open (best-effort).
        /// @note No TLS shutdown is performed
        void close_https() noexcept;

        /// @brief Resolve and connect the lowest layer to host:port.
        VoidResult connect_tcp(HttpStream& stream, const std::string& host,
                               const std::string& port);

        /// @brief Issue CONNECT through the proxy for the origin.
        VoidResult open_tunnel(HttpStream& stream);

        VoidResult handshake(HttpsStream& stream);

        template <typename S>
        VoidResult write_on(S& stream, const PreparedRequest& request);

        template <typename S>
        Result<Response> read_on(S& stream);

        /// @brief Run queued operations until they complete.
        void run_io();

        HttpStream* lowest_layer() noexcept;
        const HttpStream* lowest_layer() const noexcept;

        const std::string& tls_host_name() const noexcept;

        boost::asio::io_context m_ioc{1};
        std::shared_ptr<TlsContext> m_tls;
        std::optional<UrlComponents> m_proxy;

        Stream m_stream;
        // Descriptor of the open socket for the liveness poll, else -1
        int m_fd{-1};
        boost::beast::flat_buffer m_buffer{};

        bool m_reusable{true};
        bool m_verified{false};
        bool m_expect_no_body{false};
    };

    /// @brief Factory for the Beast backend. Each call returns a factory
    /// with its own TLS context; give every pool its own.
    ConnectionFactory make_tcp_connection_factory();

}  // namespace poolhttp
