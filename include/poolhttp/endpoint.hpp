#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

#include "config.hpp"
#include "url.hpp"

namespace poolhttp {

    struct Endpoint {
        std::string host;
        std::string port;
        bool https{false};

        void clear() {
            host.clear();
            port.clear();
            https = false;
        }

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }
    };

    inline Endpoint endpoint_from_url(const UrlComponents& u) {
        Endpoint ep;
        ep.host = u.host;
        ep.port = u.port;
        ep.https = u.https;
        ep.normalize_default_port();
        ep.normalize_host();
        return ep;
    }

    /// @brief "scheme://host:port", for logs.
    inline std::string to_string(const Endpoint& ep) {
        return (ep.https ? "https://" : "http://") + ep.host + ":" + ep.port;
    }

    /// @brief True when both URLs name the same scheme, host and port.
    inline bool is_same_origin(const UrlComponents& a, const UrlComponents& b) {
        return endpoint_from_url(a) == endpoint_from_url(b);
    }

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load trust anchors and client credentials into a context.
    /// @throws std::runtime_error if a configured file cannot be loaded.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        const ConnectionOptions& opts) {
        try {
            if (opts.ca_file || opts.ca_path) {
                if (opts.ca_file) ssl_context.load_verify_file(*opts.ca_file);
                if (opts.ca_path) ssl_context.add_verify_path(*opts.ca_path);
            } else {
                // Load system default CA certificates
                ssl_context.set_default_verify_paths();
            }

            if (opts.cert_file) {
                ssl_context.use_certificate_chain_file(*opts.cert_file);
                ssl_context.use_private_key_file(
                    opts.key_file ? *opts.key_file : *opts.cert_file,
                    boost::asio::ssl::context::pem);
            }
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to initialise TLS context: ") + e.what());
        }

        /// Configure verification mode + throw out the old one
        static_cast<void>(ssl_context.set_verify_mode(
            opts.verify_tls ? boost::asio::ssl::verify_peer
                            : boost::asio::ssl::verify_none));
    }

    namespace detail {
        inline void fnv_mix(std::size_t& h, std::string_view s) noexcept {
            for (unsigned char c : s) {
                h ^= c;
                h *= 1099511628211ull;
            }
        }

        inline void fnv_mix(std::size_t& h, std::size_t v) noexcept {
            h ^= v;
            h *= 1099511628211ull;
        }
    }  // namespace detail

}  // namespace poolhttp

namespace std {
    template <>
    struct hash<poolhttp::Endpoint> {
        size_t operator()(poolhttp::Endpoint const& e) const noexcept {
            size_t h = 1469598103934665603ull;
            poolhttp::detail::fnv_mix(h, static_cast<size_t>(e.https));
            poolhttp::detail::fnv_mix(h, e.host);
            poolhttp::detail::fnv_mix(h, e.port);
            return h;
        }
    };
}  // namespace std
