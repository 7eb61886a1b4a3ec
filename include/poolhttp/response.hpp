#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "headers.hpp"

namespace poolhttp {

    /**
     * @brief Represents an HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP response headers, in wire order. */
        Headers headers;
        /** @brief HTTP response body as a string. */
        std::string body;
        /** @brief False when the server asked to close the connection. */
        bool keep_alive{true};

        /** @brief First value of a header, or nullptr. */
        const std::string* header(std::string_view name) const noexcept {
            return header_utils::find(headers, name);
        }

        bool is_redirect() const noexcept {
            switch (status_code) {
                case 301:
                case 302:
                case 303:
                case 307:
                case 308:
                    return true;
                default:
                    return false;
            }
        }

        /** @brief Location header of a redirect response. */
        std::optional<std::string> redirect_location() const {
            if (!is_redirect()) return std::nullopt;
            if (const auto* loc = header("Location")) return *loc;
            return std::nullopt;
        }
    };

    /// @brief Convert a Boost.Beast HTTP response to a poolhttp::Response.
    /// @param beast_res The Boost.Beast HTTP response.
    /// @return A poolhttp::Response with status, headers, and body.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());
        out.keep_alive = beast_res.keep_alive();

        for (const auto& field : beast_res.base()) {
            out.headers.emplace_back(std::string(field.name_string()),
                                     std::string(field.value()));
        }

        // Move body instead of copying
        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace poolhttp
