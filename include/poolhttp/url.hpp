#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace poolhttp {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // For a parsed absolute URL: full target (path + optional query).
        // For a parsed base URL (via parse_base_url): normalized prefix path
        // ("" or "/api") For a resolved URL: full request target.
        std::string target;
    };

    namespace url_utils {

        inline bool starts_with_nocase(std::string_view s,
                                       std::string_view prefix) {
            if (s.size() < prefix.size()) return false;
            for (std::size_t i = 0; i < prefix.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i])
                    return false;
            }
            return true;
        }

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        /// @param s The URL string to check.
        /// @return True if the URL starts with "http://" or "https://"
        /// (scheme compared case-insensitively).
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return starts_with_nocase(s, "https://") ||
                   starts_with_nocase(s, "http://");
        }

        /// @brief True if `s` starts with `scheme ":"`, the scheme ending
        /// before any '/', '?' or '#'.
        inline bool has_scheme(std::string_view s) noexcept {
            const auto colon = s.find(':');
            if (colon == std::string_view::npos || colon == 0) return false;
            if (s.find_first_of("/?#") < colon) return false;
            if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
            for (std::size_t i = 1; i < colon; ++i) {
                const auto c = static_cast<unsigned char>(s[i]);
                if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
                    return false;
            }
            return true;
        }

        /// @brief Trim trailing slashes from a string.
        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        inline std::string default_port(bool https) {
            return https ? "443" : "80";
        }

        /// @brief Parse a base_url into components suitable for resolving
        /// relative targets. The returned UrlComponents.target is a *normalized
        /// prefix*:
        /// - "/" becomes ""
        /// - trailing '/' removed
        /// - query is rejected (to keep prefix joining simple/fast)
        inline Result<UrlComponents> parse_base_url(std::string_view base_url);

        /// @brief Resolve a request URL (absolute or relative) against an
        /// optional base URL prefix.
        inline Result<UrlComponents> resolve_url(
            std::string_view uri_or_url,
            const UrlComponents* base /*nullable*/);

        /// @brief Resolve a redirect Location against the URL that produced
        /// it. Handles absolute, scheme-relative ("//h/p"), absolute-path,
        /// query-only and relative-path references.
        inline Result<UrlComponents> join_url(const UrlComponents& base,
                                              std::string_view location);

        /// @brief Remove "." and ".." segments from an absolute path.
        inline std::string remove_dot_segments(std::string_view path);

    }  // namespace url_utils

    /// @brief Parse an absolute URL into its components.
    /// @param url The URL string to parse.
    /// @return A Result containing the UrlComponents on success, or an Error on
    /// failure.
    inline Result<UrlComponents> parse_url(const std::string& url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(ErrorCode::InvalidUrl,
                                              std::move(msg) + ": " + url);
        };

        std::string_view s(url);

        bool https = false;
        if (url_utils::starts_with_nocase(s, "https://")) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (url_utils::starts_with_nocase(s, "http://")) {
            https = false;
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Fragments never go on the wire
        if (auto hash = s.find('#'); hash != std::string_view::npos) {
            s = s.substr(0, hash);
        }

        // Split authority from path (a query may follow the host directly)
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto cut = s.find_first_of("/?"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            path = s.substr(cut);
        }

        // Drop userinfo
        if (auto at = hostport.rfind('@'); at != std::string_view::npos) {
            hostport.remove_prefix(at + 1);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        if (hostport.front() == '[') {
            // IPv6 literal
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = std::string(hostport.substr(1, close - 1));
            auto rest = hostport.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') return make_err("URL has bad port");
                port = std::string(rest.substr(1));
                if (port.empty()) return make_err("URL has empty port");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
        } else {
            host = std::string(hostport);
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        if (port.empty()) {
            port = url_utils::default_port(https);
        } else {
            if (port.size() > 5) return make_err("URL has invalid port");
            for (char c : port) {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return make_err("URL has invalid port");
            }
            const int n = std::stoi(port);
            if (n <= 0 || n > 65535) return make_err("URL has invalid port");
        }

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        if (path.empty()) {
            out.target = "/";
        } else if (path.front() == '?') {
            out.target = "/" + std::string(path);
        } else {
            out.target = std::string(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

    /// @brief Render components back into an absolute URL. Default ports
    /// are omitted.
    inline std::string to_string(const UrlComponents& u) {
        std::string out = u.https ? "https://" : "http://";
        if (u.host.find(':') != std::string::npos) {
            out += "[" + u.host + "]";
        } else {
            out += u.host;
        }
        if (!u.port.empty() && u.port != url_utils::default_port(u.https)) {
            out += ":" + u.port;
        }
        out += u.target.empty() ? "/" : u.target;
        return out;
    }

    // ---- url_utils implementations ----

    namespace url_utils {

        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            auto make_err = [&](std::string msg) -> Result<UrlComponents> {
                return Result<UrlComponents>::err(ErrorCode::InvalidUrl,
                                                  std::move(msg));
            };

            if (base_url.empty()) {
                return make_err("base_url is empty");
            }
            if (!is_absolute_url_with_protocol(base_url)) {
                return make_err("base_url must start with http:// or https://");
            }

            auto parsed = poolhttp::parse_url(std::string(base_url));
            if (parsed.has_error())
                return Result<UrlComponents>::err(parsed.error());

            UrlComponents b = std::move(parsed.value());

            // Normalize prefix in b.target
            b.target = trim_trailing_slashes(std::move(b.target));
            if (b.target == "/") b.target.clear();

            // Keep joining simple/fast: reject query in base prefix
            if (b.target.find('?') != std::string::npos) {
                return make_err("base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        inline Result<UrlComponents> resolve_url(std::string_view uri_or_url,
                                                 const UrlComponents* base) {
            // Absolute URL => parse (slow path)
            if (is_absolute_url_with_protocol(uri_or_url)) {
                return poolhttp::parse_url(std::string(uri_or_url));
            }

            // Relative => requires base
            if (base == nullptr || base->host.empty() || base->port.empty()) {
                return Result<UrlComponents>::err(
                    ErrorCode::InvalidUrl,
                    "Relative URI provided but base_url is empty");
            }

            // Normalize rel: "" => "/", "health" => "/health"
            std::string_view rel = uri_or_url;
            std::string rel_storage;

            if (rel.empty()) {
                rel = "/";
            } else if (rel.front() != '/') {
                rel_storage.reserve(rel.size() + 1);
                rel_storage.push_back('/');
                rel_storage.append(rel);
                rel = rel_storage;
            }

            // Join prefix(base->target) + rel
            std::string target;
            if (base->target.empty()) {
                target.assign(rel);
            } else {
                target.reserve(base->target.size() + rel.size());
                target.append(base->target);  // prefix has no trailing '/'
                target.append(rel);           // rel begins with '/'
            }

            UrlComponents out;
            out.https = base->https;
            out.host = base->host;
            out.port = base->port;
            out.target = std::move(target);
            return Result<UrlComponents>::ok(std::move(out));
        }

        inline std::string remove_dot_segments(std::string_view path) {
            std::vector<std::string_view> segments;
            std::size_t pos = 0;
            const bool trailing_slash =
                !path.empty() &&
                (path.back() == '/' || path.ends_with("/.") ||
                 path.ends_with("/.."));

            while (pos <= path.size()) {
                auto next = path.find('/', pos);
                if (next == std::string_view::npos) next = path.size();
                auto seg = path.substr(pos, next - pos);
                if (seg == "..") {
                    if (!segments.empty()) segments.pop_back();
                } else if (!seg.empty() && seg != ".") {
                    segments.push_back(seg);
                }
                pos = next + 1;
            }

            std::string out;
            for (auto seg : segments) {
                out.push_back('/');
                out.append(seg);
            }
            if (out.empty() || trailing_slash) out.push_back('/');
            return out;
        }

        inline Result<UrlComponents> join_url(const UrlComponents& base,
                                              std::string_view location) {
            if (auto hash = location.find('#');
                hash != std::string_view::npos) {
                location = location.substr(0, hash);
            }

            if (is_absolute_url_with_protocol(location)) {
                return poolhttp::parse_url(std::string(location));
            }

            if (location.size() >= 2 && location[0] == '/' &&
                location[1] == '/') {
                std::string abs = base.https ? "https:" : "http:";
                abs.append(location);
                return poolhttp::parse_url(abs);
            }

            if (has_scheme(location)) {
                return Result<UrlComponents>::err(
                    ErrorCode::InvalidUrl,
                    "Unsupported redirect scheme: " + std::string(location));
            }

            UrlComponents out = base;
            if (location.empty()) return Result<UrlComponents>::ok(out);

            const std::string& bt = base.target.empty() ? "/" : base.target;
            const auto q = bt.find('?');
            const std::string base_path = bt.substr(0, q);

            if (location.front() == '?') {
                out.target = base_path + std::string(location);
                return Result<UrlComponents>::ok(std::move(out));
            }

            std::string_view loc_path = location;
            std::string_view loc_query;
            if (auto lq = location.find('?'); lq != std::string_view::npos) {
                loc_path = location.substr(0, lq);
                loc_query = location.substr(lq);
            }

            std::string merged;
            if (loc_path.front() == '/') {
                merged.assign(loc_path);
            } else {
                auto slash = base_path.rfind('/');
                merged = (slash == std::string::npos)
                             ? std::string("/")
                             : base_path.substr(0, slash + 1);
                merged.append(loc_path);
            }

            out.target = remove_dot_segments(merged);
            out.target.append(loc_query);
            return Result<UrlComponents>::ok(std::move(out));
        }

    }  // namespace url_utils

}  // namespace poolhttp
