#pragma once
#include <chrono>
#include <exception>
#include <optional>
#include <string>

#include "cancellation.hpp"
#include "config.hpp"
#include "pool_manager.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "retry.hpp"
#include "serialize_impl.hpp"
#include "url.hpp"

namespace poolhttp {

    /**
     * @brief Per-request overrides of the client configuration.
     */
    struct RequestOptions {
        /** @brief Retry policy; the configured one when unset. */
        std::optional<Retry> retry;

        /** @brief Follow redirects; the configured default when unset. */
        std::optional<bool> redirect;

        /** @brief How long to wait for a pooled connection. */
        std::optional<std::chrono::milliseconds> pool_timeout;

        /** @brief Cancels backoff sleeps and bounds pool waits. */
        std::optional<CancellationToken> cancel;
    };

    /**
     * @brief Run one logical request, following redirects and retrying
     * through the pools of `manager` until it succeeds, the retry policy
     * gives up or a fatal error occurs.
     * @param request Method, absolute URL, headers and body.
     * @return The final response, or the terminal error (with the attempt
     * history for MaxRetryExceeded and TooManyRedirects).
     */
    [[nodiscard]] Result<Response> request(PoolManager& manager,
                                           const Request& request,
                                           RequestOptions options = {});

    /**
     * @brief A thread-safe, pooling HTTP client.
     *
     * Owns one PoolManager; connections are reused across calls and across
     * threads. Relative URLs are resolved against base_url.
     */
    class HttpClient {
       public:
        /**
         * @brief Constructs an HttpClient with the given configuration.
         * @throws std::runtime_error if base_url is invalid.
         * @throws std::invalid_argument for unusable pool settings.
         */
        explicit HttpClient(ClientConfiguration config);
        ~HttpClient() = default;

        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;

        HttpClient(HttpClient&&) = delete;
        HttpClient& operator=(HttpClient&&) = delete;

        /**
         * @brief Returns the client's configuration.
         * @return A constant reference to the configuration.
         */
        [[nodiscard]] const ClientConfiguration& config() const noexcept;

        /// @brief The registry backing this client.
        [[nodiscard]] PoolManager& pool_manager() noexcept;

        /**
         * @brief Sends a manual request.
         * @param request The request object containing method, URL, headers, and body.
         * @param options Per-request retry, redirect and pool overrides.
         * @return A Result object containing the Response or an Error.
         */
        [[nodiscard]] Result<Response> send(const Request& request,
                                            RequestOptions options = {});

        /**
         * @brief Convenience methods for common HTTP verbs.
         * @{
         */

        [[nodiscard]] Result<Response> get(const std::string& url,
                                           RequestOptions options = {});

        [[nodiscard]] Result<Response> head(const std::string& url,
                                            RequestOptions options = {});

        [[nodiscard]] Result<Response> del(const std::string& url,
                                           RequestOptions options = {});

        [[nodiscard]] Result<Response> options(const std::string& url,
                                               RequestOptions options = {});

        [[nodiscard]] Result<Response> post(const std::string& url,
                                            std::string body,
                                            RequestOptions options = {});

        [[nodiscard]] Result<Response> put(const std::string& url,
                                           std::string body,
                                           RequestOptions options = {});

        [[nodiscard]] Result<Response> patch(const std::string& url,
                                             std::string body,
                                             RequestOptions options = {});
        /** @} */

        /**
         * @name Templated versions for automatic serialization
         * These methods automatically deserialize the JSON response body into a DTO of type T.
         * @{
         */

        /**
         * @brief Performs a GET request and deserializes the response.
         * @tparam T The type to deserialize into.
         * @param url The target URL or path.
         * @return A Result containing the deserialized object or an Error.
         */
        template <typename T>
        [[nodiscard]] Result<T> get(const std::string& url) {
            return to_result_t<T>(get(url, RequestOptions{}));
        }

        template <typename T>
        [[nodiscard]] Result<T> del(const std::string& url) {
            return to_result_t<T>(del(url, RequestOptions{}));
        }

        /**
         * @brief Performs a POST request and deserializes the response.
         * @tparam T The type to deserialize into.
         * @param url The target URL or path.
         * @param body The request body.
         * @return A Result containing the deserialized object or an Error.
         */
        template <typename T>
        [[nodiscard]] Result<T> post(const std::string& url, std::string body) {
            return to_result_t<T>(post(url, std::move(body), RequestOptions{}));
        }

        template <typename T>
        [[nodiscard]] Result<T> put(const std::string& url, std::string body) {
            return to_result_t<T>(put(url, std::move(body), RequestOptions{}));
        }

        template <typename T>
        [[nodiscard]] Result<T> patch(const std::string& url,
                                      std::string body) {
            return to_result_t<T>(
                patch(url, std::move(body), RequestOptions{}));
        }
        /** @} */

       private:
        template <typename T>
        Result<T> to_result_t(Result<Response>&& res) {
            if (res.has_error()) {
                return Result<T>::err(res.error());
            }
            T out;
            try {
                // Lookup deserialize via ADL or from included headers
                deserialize(res.value(), out);
            } catch (const std::exception& e) {
                return Result<T>::err(
                    ErrorCode::Unknown,
                    std::string("Failed to deserialize response: ") +
                        e.what());
            }
            return Result<T>::ok(std::move(out));
        }

        ClientConfiguration m_config{};
        std::optional<UrlComponents> m_base_url;
        PoolManager m_manager;
    };

}  // namespace poolhttp
