#include "poolhttp/client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

#include "poolhttp/endpoint.hpp"
#include "poolhttp/headers.hpp"

namespace poolhttp {

    namespace {

        // Headers describing a body that a 303 turns into a bodiless GET.
        constexpr std::string_view kBodyHeaders[] = {
            "Content-Type",     "Content-Length", "Content-Encoding",
            "Content-Language", "Content-Location", "Digest",
            "Last-Modified",
        };

        Error cancelled_error(const std::string& url) {
            return Error{ErrorCode::Cancelled, "Request cancelled: " + url};
        }

        std::optional<std::chrono::milliseconds> pool_wait(
            const ConnectionPool& pool, const RequestOptions& options) {
            std::optional<std::chrono::milliseconds> wait =
                options.pool_timeout ? options.pool_timeout
                                     : pool.config().pool_timeout;
            if (options.cancel) {
                if (auto left = options.cancel->remaining()) {
                    auto ms = std::chrono::ceil<std::chrono::milliseconds>(
                        *left);
                    wait = wait ? std::min(*wait, ms) : ms;
                }
            }
            return wait;
        }

        Result<Response> attempt(ConnectionPool& pool,
                                 const PreparedRequest& preq,
                                 const RequestOptions& options) {
            auto lease_res = pool.acquire(pool_wait(pool, options));
            if (lease_res.has_error()) {
                return Result<Response>::err(std::move(lease_res).error());
            }
            ConnectionPool::Lease lease = std::move(lease_res).value();

            auto res = lease->request(preq);
            if (res.has_error() || !res.value().keep_alive) {
                pool.invalidate(std::move(lease));
            } else {
                pool.release(std::move(lease));
            }
            return res;
        }

    }  // namespace

    Result<Response> request(PoolManager& manager, const Request& req,
                             RequestOptions options) {
        const ClientConfiguration& cfg = manager.config();
        Retry retry = options.retry ? *options.retry : Retry(cfg.retry);
        const bool follow = options.redirect.value_or(cfg.redirect);
        const CancellationToken* cancel =
            options.cancel ? &*options.cancel : nullptr;

        if (to_boost_http_method(req.method) ==
            boost::beast::http::verb::unknown) {
            return Result<Response>::err(ErrorCode::Unknown,
                                         "Unknown HTTP method");
        }

        auto parsed = parse_url(req.url);
        if (parsed.has_error()) {
            return Result<Response>::err(std::move(parsed).error());
        }

        UrlComponents url = std::move(parsed).value();
        Request current = req;

        for (;;) {
            const std::string url_str = to_string(url);
            if (cancel != nullptr && cancel->is_cancelled()) {
                return Result<Response>::err(cancelled_error(url_str));
            }

            auto pool = manager.connection_from_url(url);
            auto res =
                attempt(*pool, prepare_request(current, url, cfg.user_agent),
                        options);

            if (res.has_error()) {
                const Error& error = res.error();
                if (cancel != nullptr && cancel->is_cancelled() &&
                    error.code == ErrorCode::PoolExhausted) {
                    return Result<Response>::err(cancelled_error(url_str));
                }

                auto next = retry.increment(current.method, url_str, error);
                if (next.has_error()) {
                    return Result<Response>::err(std::move(next).error());
                }
                retry = std::move(next).value();

                SPDLOG_WARN("Retrying ({}) after connection broken by '{}': {}",
                            retry.to_string(), to_string(error.code),
                            error.message);

                auto slept = retry.sleep(nullptr, cancel);
                if (slept.has_error()) {
                    return Result<Response>::err(std::move(slept).error());
                }
                continue;
            }

            Response response = std::move(res).value();

            std::optional<std::string> location;
            if (follow) location = response.redirect_location();

            if (location) {
                auto joined = url_utils::join_url(url, *location);
                if (joined.has_error()) {
                    return Result<Response>::err(std::move(joined).error());
                }
                UrlComponents next_url = std::move(joined).value();

                if (response.status_code == 303 &&
                    current.method != HttpMethod::Head) {
                    current.method = HttpMethod::Get;
                    current.body.reset();
                    for (auto name : kBodyHeaders) {
                        header_utils::erase(current.headers, name);
                    }
                }

                auto next = retry.increment(current.method, url_str, response);
                if (next.has_error()) {
                    if (retry.config().raise_on_redirect) {
                        Error e = std::move(next).error();
                        e.code = ErrorCode::TooManyRedirects;
                        return Result<Response>::err(std::move(e));
                    }
                    return Result<Response>::ok(std::move(response));
                }
                retry = std::move(next).value();

                if (!is_same_origin(url, next_url)) {
                    for (const auto& name :
                         retry.config().remove_headers_on_redirect) {
                        header_utils::erase(current.headers, name);
                    }
                }

                SPDLOG_INFO("Redirecting {} -> {}", url_str,
                            to_string(next_url));

                auto slept = retry.sleep_for_retry(response, cancel);
                if (slept.has_error()) {
                    return Result<Response>::err(std::move(slept).error());
                }

                url = std::move(next_url);
                current.url = to_string(url);
                continue;
            }

            const bool has_retry_after =
                response.header("Retry-After") != nullptr;
            if (retry.is_retry(current.method, response.status_code,
                               has_retry_after)) {
                auto next = retry.increment(current.method, url_str, response);
                if (next.has_error()) {
                    if (retry.config().raise_on_status) {
                        return Result<Response>::err(std::move(next).error());
                    }
                    return Result<Response>::ok(std::move(response));
                }
                retry = std::move(next).value();

                SPDLOG_DEBUG("Retry: {} (status {})", url_str,
                             response.status_code);

                auto slept = retry.sleep(&response, cancel);
                if (slept.has_error()) {
                    return Result<Response>::err(std::move(slept).error());
                }
                continue;
            }

            return Result<Response>::ok(std::move(response));
        }
    }

    HttpClient::HttpClient(ClientConfiguration config)
        : m_config(std::move(config)), m_manager(m_config) {
        if (m_config.base_url) {
            auto base_res = url_utils::parse_base_url(*m_config.base_url);
            if (base_res.has_error()) {
                throw std::runtime_error("Invalid base_url: " +
                                         base_res.error().message);
            }
            m_base_url = std::move(base_res.value());
        }
    }

    const ClientConfiguration& HttpClient::config() const noexcept {
        return m_config;
    }

    PoolManager& HttpClient::pool_manager() noexcept { return m_manager; }

    Result<Response> HttpClient::send(const Request& request,
                                      RequestOptions options) {
        // Resolve URL (relative targets need base_url)
        const UrlComponents* base = m_base_url ? &*m_base_url : nullptr;

        auto u_res = url_utils::resolve_url(request.url, base);
        if (u_res.has_error()) {
            return Result<Response>::err(u_res.error());
        }

        Request resolved = request;
        resolved.url = to_string(u_res.value());
        for (const auto& [name, value] : m_config.default_headers) {
            header_utils::set_default(resolved.headers, name, value);
        }

        return poolhttp::request(m_manager, resolved, std::move(options));
    }

    Result<Response> HttpClient::get(const std::string& url,
                                     RequestOptions options) {
        return send(Request{HttpMethod::Get, url, {}, std::nullopt},
                    std::move(options));
    }

    Result<Response> HttpClient::head(const std::string& url,
                                      RequestOptions options) {
        return send(Request{HttpMethod::Head, url, {}, std::nullopt},
                    std::move(options));
    }

    Result<Response> HttpClient::del(const std::string& url,
                                     RequestOptions options) {
        return send(Request{HttpMethod::Delete, url, {}, std::nullopt},
                    std::move(options));
    }

    Result<Response> HttpClient::options(const std::string& url,
                                         RequestOptions options) {
        return send(Request{HttpMethod::Options, url, {}, std::nullopt},
                    std::move(options));
    }

    Result<Response> HttpClient::post(const std::string& url,
                                      std::string body,
                                      RequestOptions options) {
        return send(Request{HttpMethod::Post, url, {}, std::move(body)},
                    std::move(options));
    }

    Result<Response> HttpClient::put(const std::string& url, std::string body,
                                     RequestOptions options) {
        return send(Request{HttpMethod::Put, url, {}, std::move(body)},
                    std::move(options));
    }

    Result<Response> HttpClient::patch(const std::string& url,
                                       std::string body,
                                       RequestOptions options) {
        return send(Request{HttpMethod::Patch, url, {}, std::move(body)},
                    std::move(options));
    }

}  // namespace poolhttp
