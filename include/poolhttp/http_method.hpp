#pragma once
#include <boost/beast/http/verb.hpp>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace http = boost::beast::http;

namespace poolhttp {
    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Trace,
    };

    inline constexpr http::verb to_boost_http_method(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            case HttpMethod::Trace:
                return http::verb::trace;
            default:
                return http::verb::unknown;
        }
    }

    /// @brief Upper-case wire name of the method ("" for unknown values).
    inline constexpr std::string_view to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            case HttpMethod::Head:
                return "HEAD";
            case HttpMethod::Options:
                return "OPTIONS";
            case HttpMethod::Trace:
                return "TRACE";
            default:
                return "";
        }
    }

    /// @brief Parse a method name, case-insensitively.
    inline std::optional<HttpMethod> parse_http_method(std::string_view name) {
        auto v = http::string_to_verb(
            boost::beast::string_view(name.data(), name.size()));
        if (v == http::verb::unknown) {
            // string_to_verb is case-sensitive; retry with an upper-cased copy
            std::string upper(name);
            for (auto& c : upper)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            v = http::string_to_verb(upper);
        }
        switch (v) {
            case http::verb::get:
                return HttpMethod::Get;
            case http::verb::post:
                return HttpMethod::Post;
            case http::verb::put:
                return HttpMethod::Put;
            case http::verb::patch:
                return HttpMethod::Patch;
            case http::verb::delete_:
                return HttpMethod::Delete;
            case http::verb::head:
                return HttpMethod::Head;
            case http::verb::options:
                return HttpMethod::Options;
            case http::verb::trace:
                return HttpMethod::Trace;
            default:
                return std::nullopt;
        }
    }

}  // namespace poolhttp
