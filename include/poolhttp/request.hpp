#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>

#include "headers.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace poolhttp {

    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        Headers headers;
        std::optional<std::string> body;
    };

    struct PreparedRequest {
        UrlComponents url;
        boost::beast::http::request<boost::beast::http::string_body> beast_req;
    };

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `insert()`, so repeated names are all sent, in order.
    inline void apply_request_headers(const Headers& in,
                                      boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.insert(k, v);
        }
    }

    /// @brief Host header value: the port is omitted when it is the
    /// scheme default.
    inline std::string host_header_value(const UrlComponents& url) {
        std::string host = url.host.find(':') != std::string::npos
                               ? "[" + url.host + "]"
                               : url.host;
        if (!url.port.empty() && url.port != url_utils::default_port(url.https))
            host += ":" + url.port;
        return host;
    }

    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const UrlComponents& url,
                          const std::string& user_agent,
                          const bool keep_alive = true) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(url.target);
        if (!header_utils::contains(req.headers, "Host"))
            beast_req.set(http::field::host, host_header_value(url));
        if (!header_utils::contains(req.headers, "User-Agent") &&
            !user_agent.empty())
            beast_req.set(http::field::user_agent, user_agent);
        beast_req.keep_alive(keep_alive);
        apply_request_headers(req.headers, beast_req.base());
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

    inline PreparedRequest prepare_request(const Request& req,
                                           const UrlComponents& url,
                                           const std::string& user_agent) {
        return PreparedRequest{url,
                               prepare_beast_request(req, url, user_agent)};
    }

}  // namespace poolhttp
