#include "poolhttp/connection/tcp_connection.hpp"

#include <poll.h>
#include <spdlog/spdlog.h>

#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <exception>

#include "poolhttp/endpoint.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace poolhttp {

    namespace {

        /// @brief Completion handler storing the error into `out`.
        auto store_ec(boost::system::error_code& out) {
            return [&out](boost::system::error_code ec, auto&&...) {
                out = ec;
            };
        }

        bool is_http_error(const boost::system::error_code& ec) {
            return ec.category() ==
                   http::make_error_code(http::error::end_of_stream).category();
        }

        Error read_error(const boost::system::error_code& ec) {
            if (ec == beast::error::timeout) {
                return Error{ErrorCode::ReadTimeout,
                             "Read timed out: " + ec.message()};
            }
            if (ec == net::error::eof || ec == ssl::error::stream_truncated ||
                is_http_error(ec)) {
                return Error{ErrorCode::ProtocolError,
                             "Malformed or truncated response: " +
                                 ec.message()};
            }
            return Error{ErrorCode::ReceiveFailed,
                         "Read failed: " + ec.message()};
        }

    }  // namespace

    // ---- TlsContext ----

    Result<ssl::context*> TlsContext::get(const ConnectionOptions& opts) {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_ctx) return Result<ssl::context*>::ok(&*m_ctx);
        if (m_error) return Result<ssl::context*>::err(*m_error);

        try {
            m_ctx.emplace(ssl::context::tls_client);
            init_tls_on_ssl_context(*m_ctx, opts);
        } catch (const std::exception& e) {
            m_ctx.reset();
            m_error = Error{ErrorCode::TlsHandshakeFailed, e.what()};
            SPDLOG_ERROR("TLS context setup failed: {}", e.what());
            return Result<ssl::context*>::err(*m_error);
        }
        return Result<ssl::context*>::ok(&*m_ctx);
    }

    // ---- TcpConnection ----

    TcpConnection::TcpConnection(PoolKey key, std::shared_ptr<TlsContext> tls)
        : Connection(std::move(key)), m_tls(std::move(tls)) {
        if (!m_tls) m_tls = std::make_shared<TlsContext>();
    }

    TcpConnection::~TcpConnection() noexcept {
        close_http();
        close_https();
    }

    void TcpConnection::close() noexcept {
        close_http();
        close_https();
        m_reusable = false;
        m_buffer.clear();
    }

    void TcpConnection::close_http() noexcept {
        boost::system::error_code ec;

        if (std::holds_alternative<HttpStream>(m_stream)) {
            auto& stream = std::get<HttpStream>(m_stream);

            static_cast<void>(
                stream.socket().shutdown(tcp::socket::shutdown_both, ec));
            static_cast<void>(stream.socket().close(ec));

            // mark connection as "no stream"
            m_stream.emplace<std::monostate>();
            m_fd = -1;
        }
    }

    void TcpConnection::close_https() noexcept {
        boost::system::error_code ec;

        if (std::holds_alternative<HttpsStream>(m_stream)) {
            auto& s = std::get<HttpsStream>(m_stream);

            // No TLS shutdown. Just close the underlying TCP socket.
            static_cast<void>(beast::get_lowest_layer(s).socket().shutdown(
                tcp::socket::shutdown_both, ec));
            static_cast<void>(beast::get_lowest_layer(s).socket().close(ec));

            m_stream.emplace<std::monostate>();
            m_fd = -1;
        }
    }

    void TcpConnection::run_io() {
        m_ioc.restart();
        m_ioc.run();
    }

    TcpConnection::HttpStream* TcpConnection::lowest_layer() noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return s;
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &beast::get_lowest_layer(*s);
        return nullptr;
    }

    const TcpConnection::HttpStream* TcpConnection::lowest_layer()
        const noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return s;
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &s->next_layer();
        return nullptr;
    }

    const std::string& TcpConnection::tls_host_name() const noexcept {
        const auto& opts = key().options;
        return opts.server_hostname ? *opts.server_hostname : endpoint().host;
    }

    bool TcpConnection::is_connected() const noexcept {
        const HttpStream* l = lowest_layer();
        return l != nullptr && l->socket().is_open();
    }

    bool TcpConnection::is_dropped() const noexcept {
        // Bytes nobody asked for: the exchange framing is off.
        if (m_buffer.size() > 0) return true;

        const HttpStream* l = lowest_layer();
        if (l == nullptr || !l->socket().is_open() || m_fd < 0) return false;

        pollfd pfd{};
        pfd.fd = m_fd;
        pfd.events = POLLIN;
        const int r = ::poll(&pfd, 1, 0);
        // Readable on an idle connection means EOF, RST or garbage.
        return r != 0;
    }

    VoidResult TcpConnection::connect() {
        close_http();
        close_https();
        m_reusable = true;
        m_verified = false;
        m_buffer.clear();

        const Endpoint& ep = endpoint();
        const auto& opts = key().options;

        if (opts.proxy_url && !m_proxy) {
            auto p = parse_url(*opts.proxy_url);
            if (p.has_error()) {
                return VoidResult::err(
                    ErrorCode::ProxyError,
                    "Invalid proxy_url: " + p.error().message);
            }
            m_proxy = std::move(p.value());
        }

        const std::string& host = m_proxy ? m_proxy->host : ep.host;
        const std::string& port = m_proxy ? m_proxy->port : ep.port;

        if (!ep.https) {
            m_stream.emplace<HttpStream>(m_ioc);
            auto r = connect_tcp(std::get<HttpStream>(m_stream), host, port);
            if (r.has_error()) {
                close_http();
                m_reusable = false;
                return r;
            }
            SPDLOG_DEBUG("Connected to {}", to_string(ep));
            return VoidResult::ok();
        }

        auto ctx = m_tls->get(opts);
        if (ctx.has_error()) {
            m_reusable = false;
            return VoidResult::err(ctx.error());
        }

        m_stream.emplace<HttpsStream>(m_ioc, *ctx.value());
        auto& s = std::get<HttpsStream>(m_stream);

        auto r = connect_tcp(beast::get_lowest_layer(s), host, port);
        if (r.has_value() && m_proxy) r = open_tunnel(beast::get_lowest_layer(s));
        if (r.has_value()) r = handshake(s);

        if (r.has_error()) {
            close_https();
            m_reusable = false;
            return r;
        }

        SPDLOG_DEBUG("Connected to {} (TLS, verified={})", to_string(ep),
                     m_verified);
        return VoidResult::ok();
    }

    VoidResult TcpConnection::connect_tcp(HttpStream& stream,
                                          const std::string& host,
                                          const std::string& port) {
        const auto& opts = key().options;
        boost::system::error_code ec;

        tcp::resolver resolver(m_ioc);
        auto results = resolver.resolve(host, port, ec);
        if (ec) {
            return VoidResult::err(
                ErrorCode::NameResolutionFailed,
                "Resolve " + host + ":" + port + " failed: " + ec.message());
        }

        stream.expires_after(opts.connect_timeout);
        stream.async_connect(results, store_ec(ec));
        run_io();

        if (ec == beast::error::timeout) {
            return VoidResult::err(ErrorCode::ConnectTimeout,
                                   "Connect to " + host + ":" + port +
                                       " timed out");
        }
        if (ec) {
            return VoidResult::err(ErrorCode::ConnectionFailed,
                                   "Connect to " + host + ":" + port +
                                       " failed: " + ec.message());
        }
        stream.expires_never();

        if (opts.tcp_nodelay) {
            boost::system::error_code opt_ec;
            static_cast<void>(
                stream.socket().set_option(tcp::no_delay(true), opt_ec));
            if (opt_ec) {
                SPDLOG_DEBUG("TCP_NODELAY not applied: {}", opt_ec.message());
            }
        }

        m_fd = stream.socket().native_handle();
        m_buffer.reserve(opts.blocksize);
        return VoidResult::ok();
    }

    VoidResult TcpConnection::open_tunnel(HttpStream& stream) {
        const auto& opts = key().options;
        const Endpoint& ep = endpoint();
        const std::string authority = ep.host + ":" + ep.port;
        boost::system::error_code ec;

        http::request<http::empty_body> req{http::verb::connect, authority, 11};
        req.set(http::field::host, authority);

        stream.expires_after(opts.connect_timeout);
        http::async_write(stream, req, store_ec(ec));
        run_io();
        if (ec) {
            return VoidResult::err(ErrorCode::ProxyError,
                                   "CONNECT write failed: " + ec.message());
        }

        // A CONNECT reply has no body even with Content-Length set
        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        http::async_read(stream, m_buffer, parser, store_ec(ec));
        run_io();
        if (ec) {
            return VoidResult::err(ErrorCode::ProxyError,
                                   "CONNECT read failed: " + ec.message());
        }
        stream.expires_never();

        const auto status = parser.get().result_int();
        if (status / 100 != 2) {
            return VoidResult::err(ErrorCode::ProxyError,
                                   "Proxy refused CONNECT " + authority +
                                       ": " + std::to_string(status));
        }
        return VoidResult::ok();
    }

    VoidResult TcpConnection::handshake(HttpsStream& s) {
        const auto& opts = key().options;
        const std::string& name = tls_host_name();
        boost::system::error_code ec;

        if (!set_sni(s, name, ec)) {
            return VoidResult::err(ErrorCode::TlsHandshakeFailed,
                                   "SNI setup failed: " + ec.message());
        }

        if (opts.verify_tls) {
            s.set_verify_callback(ssl::host_name_verification(name), ec);
            if (ec) {
                return VoidResult::err(
                    ErrorCode::TlsHandshakeFailed,
                    "Host name verification setup failed: " + ec.message());
            }
        }

        beast::get_lowest_layer(s).expires_after(opts.connect_timeout);
        s.async_handshake(ssl::stream_base::client, store_ec(ec));
        run_io();

        if (ec == beast::error::timeout) {
            return VoidResult::err(ErrorCode::ConnectTimeout,
                                   "TLS handshake timed out");
        }
        if (ec) {
            return VoidResult::err(ErrorCode::TlsHandshakeFailed,
                                   "TLS handshake failed: " + ec.message());
        }
        beast::get_lowest_layer(s).expires_never();

        m_verified = opts.verify_tls &&
                     SSL_get_verify_result(s.native_handle()) == X509_V_OK;
        return VoidResult::ok();
    }

    VoidResult TcpConnection::send(const PreparedRequest& request) {
        m_expect_no_body = request.beast_req.method() == http::verb::head;
        m_buffer.clear();

        VoidResult r = VoidResult::err(ErrorCode::SendFailed,
                                       "Connection is not open");
        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            r = write_on(*s, request);
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            r = write_on(*s, request);
        }

        if (r.has_error()) close();
        return r;
    }

    Result<Response> TcpConnection::receive() {
        Result<Response> r = Result<Response>::err(
            ErrorCode::ReceiveFailed, "Connection is not open");
        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            r = read_on(*s);
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            r = read_on(*s);
        }

        if (r.has_error()) {
            close();
        } else if (!r.value().keep_alive) {
            // Server asked to close; the pool must not reuse us.
            close();
        }
        return r;
    }

    template <typename S>
    VoidResult TcpConnection::write_on(S& stream,
                                       const PreparedRequest& request) {
        const auto& opts = key().options;
        boost::system::error_code ec;

        beast::get_lowest_layer(stream).expires_after(opts.read_timeout);
        if (m_proxy && !endpoint().https) {
            // Forward proxies want the absolute-form target
            auto absolute = request.beast_req;
            absolute.target(to_string(request.url));
            http::async_write(stream, absolute, store_ec(ec));
            run_io();
        } else {
            http::async_write(stream, request.beast_req, store_ec(ec));
            run_io();
        }

        if (ec == beast::error::timeout) {
            return VoidResult::err(ErrorCode::ReadTimeout,
                                   "Write timed out: " + ec.message());
        }
        if (ec) {
            return VoidResult::err(ErrorCode::SendFailed,
                                   "Write failed: " + ec.message());
        }
        return VoidResult::ok();
    }

    template <typename S>
    Result<Response> TcpConnection::read_on(S& stream) {
        const auto& opts = key().options;
        boost::system::error_code ec;

        http::response_parser<http::string_body> parser;
        parser.body_limit(opts.max_body_bytes);
        if (m_expect_no_body) parser.skip(true);

        beast::get_lowest_layer(stream).expires_after(opts.read_timeout);
        http::async_read(stream, m_buffer, parser, store_ec(ec));
        run_io();

        if (ec) return Result<Response>::err(read_error(ec));
        beast::get_lowest_layer(stream).expires_never();

        if (parser.get().body().size() > opts.max_body_bytes) {
            return Result<Response>::err(
                ErrorCode::ProtocolError,
                "Response body exceeds " +
                    std::to_string(opts.max_body_bytes) + " bytes");
        }

        return Result<Response>::ok(parse_beast_response(parser.release()));
    }

    ConnectionFactory make_tcp_connection_factory() {
        auto tls = std::make_shared<TlsContext>();
        return [tls](const PoolKey& key) -> std::unique_ptr<Connection> {
            return std::make_unique<TcpConnection>(key, tls);
        };
    }

}  // namespace poolhttp
