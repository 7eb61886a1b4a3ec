#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cancellation.hpp"
#include "config.hpp"
#include "error.hpp"
#include "http_method.hpp"
#include "response.hpp"
#include "result.hpp"

namespace poolhttp {

    /**
     * @brief Immutable retry policy.
     *
     * Each increment() produces a new value with smaller budgets and one
     * more history entry; the original is left untouched, so a policy can
     * be shared between concurrent requests.
     *
     * @code
     * Retry retry = Retry::from_int(3);
     * auto next = retry.increment(HttpMethod::Get, url, error);
     * if (next.has_error()) return next.error();  // MaxRetryExceeded
     * retry = std::move(next).value();
     * @endcode
     */
    class Retry {
       public:
        /// @brief Statuses for which a Retry-After header triggers a retry.
        static constexpr std::array<int, 3> kRetryAfterStatusCodes{413, 429,
                                                                   503};

        /// @brief Total used by from_int() when no count is given.
        static constexpr int kDefaultRetries = 3;

        /// @brief Default budgets (total = 10).
        Retry() = default;

        explicit Retry(RetryConfiguration cfg,
                       std::vector<RequestHistory> history = {});

        /// @brief "retries=N" shorthand; nullopt gives Retry(total=3).
        /// With redirect=false redirects are handed back, not followed.
        static Retry from_int(std::optional<int> retries, bool redirect = true);

        /// @brief "retries=false": errors come back unwrapped and redirects
        /// are not followed.
        static Retry disabled();

        const RetryConfiguration& config() const noexcept { return m_cfg; }

        const std::vector<RequestHistory>& history() const noexcept {
            return m_history;
        }

        /// @brief True when a set, non-zero budget has gone negative.
        bool is_exhausted() const noexcept;

        /**
         * @brief New policy after a failed attempt.
         * @return The next policy; the original error when it must not be
         * retried (read error on a non-retryable method, or disabled
         * policy); MaxRetryExceeded with the history once a budget runs out.
         */
        Result<Retry> increment(HttpMethod method, const std::string& url,
                                const Error& error) const;

        /// @brief New policy after a redirect or a forced-retry status.
        Result<Retry> increment(HttpMethod method, const std::string& url,
                                const Response& response) const;

        bool is_method_retryable(HttpMethod method) const;

        /// @brief Whether a response with this status must be retried.
        bool is_retry(HttpMethod method, int status_code,
                      bool has_retry_after = false) const;

        /// @brief Backoff before the next attempt; zero until two
        /// consecutive non-redirect attempts have failed.
        Seconds get_backoff_time() const;

        /// @brief Delay from a Retry-After value (seconds or HTTP-date),
        /// clamped to retry_after_max. nullopt if unparseable or past.
        std::optional<Seconds> parse_retry_after(std::string_view value) const;

        std::optional<Seconds> get_retry_after(const Response& response) const;

        /// @brief Sleep for the response's Retry-After, if it has one.
        /// @return true if it slept; Cancelled if the token fired.
        Result<bool> sleep_for_retry(
            const Response& response,
            const CancellationToken* cancel = nullptr) const;

        /// @brief Sleep before the next attempt: Retry-After when present
        /// and respected, computed backoff otherwise.
        VoidResult sleep(const Response* response = nullptr,
                         const CancellationToken* cancel = nullptr) const;

        std::string to_string() const;

       private:
        Result<Retry> increment_impl(HttpMethod method, const std::string& url,
                                     const Error* error,
                                     const Response* response) const;

        RetryConfiguration m_cfg{};
        std::vector<RequestHistory> m_history;
    };

}  // namespace poolhttp
